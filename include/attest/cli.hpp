#pragma once

#include "types.hpp"

namespace attest::cli
{

	/** Process exit codes */
	inline constexpr int kExitOk = 0;
	inline constexpr int kExitUsage = 1;
	inline constexpr int kExitRejected = 2;
	inline constexpr int kExitCorrupt = 3;

	/** Map a ledger error to the process exit code */
	int exit_code_for(const LedgerError &error);

	int run(int argc, char *argv[]);

} // namespace attest::cli
