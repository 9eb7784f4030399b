#include "attest/timestamp.hpp"
#include <fmt/format.h>

namespace attest
{

    namespace
    {
        bool read_digits(std::string_view text, std::size_t &pos, std::size_t count, int &out)
        {
            if (pos + count > text.size())
                return false;
            int value = 0;
            for (std::size_t i = 0; i < count; ++i)
            {
                char c = text[pos + i];
                if (c < '0' || c > '9')
                    return false;
                value = value * 10 + (c - '0');
            }
            pos += count;
            out = value;
            return true;
        }

        bool expect(std::string_view text, std::size_t &pos, char c)
        {
            if (pos >= text.size() || text[pos] != c)
                return false;
            ++pos;
            return true;
        }

        LedgerError bad_timestamp(std::string_view text)
        {
            return LedgerError::parsing(fmt::format("Invalid RFC 3339 timestamp: '{}'", text));
        }
    } // namespace

    std::string format_rfc3339_nano(Timestamp ts)
    {
        using namespace std::chrono;

        auto day = floor<days>(ts);
        year_month_day ymd{day};
        hh_mm_ss<nanoseconds> tod{ts - day};

        std::string out = fmt::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}",
                                      static_cast<int>(ymd.year()),
                                      static_cast<unsigned>(ymd.month()),
                                      static_cast<unsigned>(ymd.day()),
                                      tod.hours().count(),
                                      tod.minutes().count(),
                                      tod.seconds().count());

        auto frac = tod.subseconds().count();
        if (frac != 0)
        {
            std::string digits = fmt::format("{:09d}", frac);
            digits.erase(digits.find_last_not_of('0') + 1);
            out += '.';
            out += digits;
        }
        out += 'Z';
        return out;
    }

    Result<Timestamp> parse_rfc3339(std::string_view text)
    {
        using namespace std::chrono;

        std::size_t pos = 0;
        int y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;

        if (!read_digits(text, pos, 4, y) || !expect(text, pos, '-') ||
            !read_digits(text, pos, 2, mo) || !expect(text, pos, '-') ||
            !read_digits(text, pos, 2, d))
            return std::unexpected(bad_timestamp(text));

        if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't'))
            return std::unexpected(bad_timestamp(text));
        ++pos;

        if (!read_digits(text, pos, 2, h) || !expect(text, pos, ':') ||
            !read_digits(text, pos, 2, mi) || !expect(text, pos, ':') ||
            !read_digits(text, pos, 2, s))
            return std::unexpected(bad_timestamp(text));

        if (h > 23 || mi > 59 || s > 59)
            return std::unexpected(bad_timestamp(text));

        year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
        if (!ymd.ok())
            return std::unexpected(bad_timestamp(text));

        long long nanos = 0;
        if (pos < text.size() && text[pos] == '.')
        {
            ++pos;
            std::size_t digits = 0;
            while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9')
            {
                if (++digits > 9)
                    return std::unexpected(bad_timestamp(text));
                nanos = nanos * 10 + (text[pos] - '0');
                ++pos;
            }
            if (digits == 0)
                return std::unexpected(bad_timestamp(text));
            for (std::size_t i = digits; i < 9; ++i)
                nanos *= 10;
        }

        minutes offset{0};
        if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z'))
        {
            ++pos;
        }
        else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-'))
        {
            int sign = text[pos] == '-' ? -1 : 1;
            ++pos;
            int oh = 0, om = 0;
            if (!read_digits(text, pos, 2, oh) || !expect(text, pos, ':') || !read_digits(text, pos, 2, om))
                return std::unexpected(bad_timestamp(text));
            if (oh > 23 || om > 59)
                return std::unexpected(bad_timestamp(text));
            offset = minutes{sign * (oh * 60 + om)};
        }
        else
        {
            return std::unexpected(bad_timestamp(text));
        }

        if (pos != text.size())
            return std::unexpected(bad_timestamp(text));

        // Whole seconds first: Timestamp only spans about 1677..2262
        sys_seconds utc = sys_days{ymd} + hours{h} + minutes{mi} + seconds{s} - offset;
        if (utc < ceil<seconds>(Timestamp::min()) || utc >= floor<seconds>(Timestamp::max()))
            return std::unexpected(bad_timestamp(text));

        return time_point_cast<nanoseconds>(utc) + nanoseconds{nanos};
    }

    Timestamp now_utc()
    {
        return std::chrono::time_point_cast<std::chrono::nanoseconds>(std::chrono::system_clock::now());
    }

} // namespace attest
