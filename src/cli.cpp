#include "attest/cli.hpp"
#include "attest/audit.hpp"
#include "attest/config.hpp"
#include "attest/key_custodian.hpp"
#include "attest/ledger.hpp"
#include "attest/timestamp.hpp"
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iostream>
#include <sstream>

namespace attest::cli
{

	namespace
	{
		int report_error(const LedgerError &error)
		{
			std::cerr << error_code_to_string(error.code) << ": " << error.what() << std::endl;
			return exit_code_for(error);
		}

		Result<LedgerConfig> load_config(const std::string &path)
		{
			auto cfg = path.empty() ? ConfigLoader::from_env() : ConfigLoader::load(path);
			if (!cfg)
				return cfg;
			if (auto logging = init_logging(cfg->logging); !logging)
				return std::unexpected(logging.error());
			return cfg;
		}

		std::string pretty(const nlohmann::json &j)
		{
			return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
		}

		nlohmann::json records_to_json(const std::vector<SignatureRecord> &records)
		{
			auto out = nlohmann::json::array();
			for (const auto &record : records)
				out.push_back(record.to_json());
			return out;
		}
	} // namespace

	int exit_code_for(const LedgerError &error)
	{
		switch (error.code)
		{
		case ErrorCode::AlreadyAcknowledged:
		case ErrorCode::SubjectChanged:
		case ErrorCode::NonceReused:
			return kExitRejected;
		default:
			return kExitUsage;
		}
	}

	int run(int argc, char *argv[])
	{
		// Command output goes to stdout; logs and audit events to stderr
		spdlog::set_default_logger(spdlog::stderr_color_mt("attest"));

		CLI::App app{"Proof-of-read attestation ledger"};
		app.require_subcommand(1);

		std::string config_path;
		app.add_option("--config", config_path, "Path to config TOML (defaults plus environment when omitted)");

		auto cfg_cmd = app.add_subcommand("config-print", "Load and print config as JSON");

		auto keygen_cmd = app.add_subcommand("keygen", "Generate a base64 Ed25519 private key");

		auto pub_cmd = app.add_subcommand("public-key", "Print the public key of the configured signing key");

		std::string subject_id;
		std::string signer_id;
		std::string signer_email;
		std::string signer_name;
		std::string signed_at_text;
		std::string nonce;
		std::string checksum;
		std::string expected_checksum;
		auto append_cmd = app.add_subcommand("append", "Sign and append an acknowledgment");
		append_cmd->add_option("--subject", subject_id, "Subject (document) id")->required();
		append_cmd->add_option("--signer", signer_id, "Authenticated signer id")->required();
		append_cmd->add_option("--email", signer_email, "Signer email")->required();
		append_cmd->add_option("--name", signer_name, "Signer display name");
		append_cmd->add_option("--signed-at", signed_at_text, "RFC 3339 signing time (defaults to now)");
		append_cmd->add_option("--nonce", nonce, "Anti-replay nonce (generated when omitted)");
		append_cmd->add_option("--checksum", checksum, "Checksum of the version being acknowledged");
		append_cmd->add_option("--current-checksum", expected_checksum,
							   "Current checksum of the subject; a differing --checksum is rejected");

		auto status_cmd = app.add_subcommand("status", "Show whether a signer acknowledged a subject");
		status_cmd->add_option("--subject", subject_id, "Subject id")->required();
		status_cmd->add_option("--signer", signer_id, "Signer id or email")->required();

		std::uint64_t from{1};
		std::uint64_t to{0};
		auto list_cmd = app.add_subcommand("list", "List records as JSON");
		auto list_subject = list_cmd->add_option("--subject", subject_id, "Only records for this subject");
		auto list_signer = list_cmd->add_option("--signer", signer_id, "Only records by this signer");
		list_subject->excludes(list_signer);
		list_cmd->add_option("--from", from, "First id (default 1)");
		list_cmd->add_option("--to", to, "Last id (default tail)");

		auto verify_cmd = app.add_subcommand("verify", "Verify hashes, links and signatures of the chain");
		verify_cmd->add_option("--from", from, "First id (default 1)");
		verify_cmd->add_option("--to", to, "Last id (default tail)");

		std::string record_path;
		std::string public_key_b64;
		auto verify_record_cmd = app.add_subcommand("verify-record", "Verify one exported record JSON");
		verify_record_cmd->add_option("--file", record_path, "Path to record JSON")->required();
		verify_record_cmd->add_option("--public-key", public_key_b64,
									  "Base64 Ed25519 public key (defaults to the configured key)");

		CLI11_PARSE(app, argc, argv);

		if (*keygen_cmd)
		{
			auto secret = KeyCustodian::generate_private_key_b64();
			if (!secret)
				return report_error(secret.error());
			auto custodian = KeyCustodian::load(SigningConfig{*secret});
			if (!custodian)
				return report_error(custodian.error());

			nlohmann::json out = {{"private_key", *secret}, {"public_key", custodian->public_key_b64()}};
			std::cout << pretty(out) << std::endl;
			return kExitOk;
		}

		auto cfg = load_config(config_path);
		if (!cfg)
			return report_error(cfg.error());

		if (*cfg_cmd)
		{
			std::cout << pretty(ConfigLoader::to_json(*cfg)) << std::endl;
			return kExitOk;
		}

		if (*pub_cmd)
		{
			auto custodian = KeyCustodian::load(cfg->signing);
			if (!custodian)
				return report_error(custodian.error());
			std::cout << custodian->public_key_b64() << std::endl;
			return kExitOk;
		}

		if (*verify_record_cmd)
		{
			std::ifstream f(record_path);
			if (!f.is_open())
			{
				std::cerr << "Unable to open record file" << std::endl;
				return kExitUsage;
			}
			std::stringstream buf;
			buf << f.rdbuf();
			auto j = nlohmann::json::parse(buf.str(), nullptr, false);
			if (j.is_discarded())
				return report_error(LedgerError::parsing("Record file is not valid JSON"));

			auto record = SignatureRecord::from_json(j);
			if (!record)
				return report_error(record.error());

			crypto::Ed25519PublicKey public_key{};
			if (public_key_b64.empty())
			{
				auto custodian = KeyCustodian::load(cfg->signing);
				if (!custodian)
					return report_error(custodian.error());
				public_key = custodian->public_key();
			}
			else
			{
				auto decoded = crypto::from_base64<32>(public_key_b64);
				if (!decoded)
					return report_error(LedgerError::invalid_key_material(decoded.error().what()));
				public_key = *decoded;
			}

			auto problems = verify_record(*record, public_key);
			auto out = nlohmann::json::array();
			for (const auto &p : problems)
				out.push_back(p.to_json());
			std::cout << pretty({{"record_id", record->id}, {"valid", problems.empty()}, {"discrepancies", out}})
					  << std::endl;
			return problems.empty() ? kExitOk : kExitCorrupt;
		}

		std::shared_ptr<DocumentCatalog> catalog;
		if (*append_cmd && !expected_checksum.empty())
		{
			auto known = std::make_shared<InMemoryDocumentCatalog>();
			known->put(subject_id, expected_checksum);
			catalog = known;
		}

		auto ledger = Ledger::open(*cfg, catalog);
		if (!ledger)
			return report_error(ledger.error());

		if (*append_cmd)
		{
			AppendRequest request;
			request.fact.subject_id = subject_id;
			request.fact.signer_id = signer_id;
			request.fact.signer_email = signer_email;
			request.fact.nonce = nonce;
			request.signer_name = signer_name;
			if (!checksum.empty())
				request.fact.subject_checksum = checksum;

			if (signed_at_text.empty())
			{
				request.fact.signed_at = now_utc();
			}
			else
			{
				auto signed_at = parse_rfc3339(signed_at_text);
				if (!signed_at)
					return report_error(signed_at.error());
				request.fact.signed_at = *signed_at;
			}

			auto record = ledger->append(request);
			if (!record)
				return report_error(record.error());
			std::cout << pretty(record->to_json()) << std::endl;
			return kExitOk;
		}

		if (*status_cmd)
		{
			auto status = ledger->status(subject_id, signer_id);
			if (!status)
				return report_error(status.error());
			auto acknowledged = ledger->has_acknowledged(subject_id, signer_id);
			if (!acknowledged)
				return report_error(acknowledged.error());

			nlohmann::json out = {{"subject_id", status->subject_id},
								  {"signer_id", status->signer_id},
								  {"signed", *acknowledged}};
			out["signed_at"] = status->signed_at ? nlohmann::json(format_rfc3339_nano(*status->signed_at))
												 : nlohmann::json(nullptr);
			std::cout << pretty(out) << std::endl;
			return kExitOk;
		}

		if (*list_cmd)
		{
			auto records = !subject_id.empty()  ? ledger->signatures_for_subject(subject_id)
						   : !signer_id.empty() ? ledger->signatures_for_signer(signer_id)
												: ledger->records(from, to);
			if (!records)
				return report_error(records.error());
			std::cout << pretty(records_to_json(*records)) << std::endl;
			return kExitOk;
		}

		if (*verify_cmd)
		{
			auto report = ledger->verify_chain(from, to);
			if (!report)
				return report_error(report.error());
			std::cout << pretty(report->to_json()) << std::endl;
			return report->is_valid() ? kExitOk : kExitCorrupt;
		}

		std::cout << app.help() << std::endl;
		return kExitOk;
	}

} // namespace attest::cli
