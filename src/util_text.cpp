// util_text.cpp
#include "util_text.hpp"

#include <fmt/format.h>

#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/uchar.h>
#include <unicode/unistr.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace util {

    // Trim leading/trailing ASCII whitespace
    std::string trim(const std::string& s) {
        static constexpr char ws[] = " \t\r\n";
        const auto b = s.find_first_not_of(ws);
        if (b == std::string::npos) return "";
        const auto e = s.find_last_not_of(ws);
        return s.substr(b, e - b + 1);
    }

    // Lower-case, drop accents and keep only [\w\s./-]. Whitespace of any kind
    // (NBSP included) comes out as a plain space.
    static std::string fold_unicode(const std::string& s) {
        UErrorCode status = U_ZERO_ERROR;
        const icu::Normalizer2* nfd = icu::Normalizer2::getNFDInstance(status);
        if (U_FAILURE(status) || nfd == nullptr) {
            throw std::runtime_error("ICU: failed to get NFD normalizer");
        }

        icu::UnicodeString u = icu::UnicodeString::fromUTF8(
            icu::StringPiece(s.data(), static_cast<int32_t>(s.size())));
        u.toLower(icu::Locale::getRoot());

        icu::UnicodeString decomposed;
        nfd->normalize(u, decomposed, status);
        if (U_FAILURE(status)) {
            throw std::runtime_error("ICU: NFD normalize failed");
        }

        icu::UnicodeString kept;
        for (int32_t i = 0; i < decomposed.length();) {
            const UChar32 c = decomposed.char32At(i);
            i = decomposed.moveIndex32(i, 1);
            if (u_charType(c) == U_NON_SPACING_MARK) continue;
            if (u_isUWhiteSpace(c)) {
                kept.append(static_cast<UChar>(' '));
            } else if (u_isalnum(c) || c == '_' || c == '.' || c == '/' || c == '-') {
                kept.append(c);
            }
        }

        std::string out;
        kept.toUTF8String(out);
        return out;
    }

    static bool is_trailing_punct(char c) {
        return c == '.' || c == '/' || c == '-' || c == '_' || c == ' ';
    }

    std::string normalize_label(const std::string& s) {
        const std::string folded = fold_unicode(s);

        std::string out;
        out.reserve(folded.size());
        for (char c : folded) {
            if (c == ' ') {
                if (!out.empty() && out.back() != ' ') out.push_back(' ');
            } else {
                out.push_back(c);
            }
        }
        while (!out.empty() && is_trailing_punct(out.back())) out.pop_back();
        return out;
    }

    std::string normalize_employee_id(const std::string& raw, std::size_t width) {
        std::string digits;
        for (unsigned char c : raw) {
            if (std::isdigit(c)) digits.push_back(static_cast<char>(c));
        }
        if (digits.empty()) return "";
        if (digits.size() < width) digits.insert(0, width - digits.size(), '0');
        return digits;
    }

    std::size_t employee_id_width(const std::vector<std::string>& ids) {
        std::size_t width = 0;
        for (const auto& id : ids) {
            const auto n = static_cast<std::size_t>(std::count_if(id.begin(), id.end(),
                [](unsigned char c) { return std::isdigit(c) != 0; }));
            width = std::max(width, n);
        }
        return width == 0 ? 5 : width;
    }

    // Accepts "2500", "2 500,50", "1234.5". Thousands separators may be spaces
    // (plain or NBSP); a lone comma is read as the decimal separator.
    std::optional<double> parse_number(const std::string& text) {
        std::string t;
        const std::string in = trim(text);
        for (std::size_t i = 0; i < in.size(); ++i) {
            const unsigned char c = static_cast<unsigned char>(in[i]);
            if (c == ' ') continue;
            if (c == 0xC2 && i + 1 < in.size() && static_cast<unsigned char>(in[i + 1]) == 0xA0) {
                ++i;
                continue;
            }
            t.push_back(static_cast<char>(c));
        }
        if (t.empty()) return std::nullopt;
        // Plain decimal notation only; strtod would also take hex, exponents and inf.
        for (std::size_t i = 0; i < t.size(); ++i) {
            const char c = t[i];
            const bool sign = (c == '-' || c == '+') && i == 0;
            if (!sign && c != '.' && c != ',' && !std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        }
        if (t.find('.') == std::string::npos && std::count(t.begin(), t.end(), ',') == 1) {
            std::replace(t.begin(), t.end(), ',', '.');
        }

        char* end = nullptr;
        const double v = std::strtod(t.c_str(), &end);
        if (end == t.c_str() || *end != '\0' || !std::isfinite(v)) return std::nullopt;
        return v;
    }

    std::string format_number(double value) {
        if (std::isfinite(value) && std::floor(value) == value && std::fabs(value) < 1e15) {
            return fmt::format("{:.0f}", value);
        }
        return fmt::format("{}", value);
    }

    bool iequals(const std::string& a, const std::string& b) {
        return a.size() == b.size() &&
            std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                return std::tolower(x) == std::tolower(y);
            });
    }

} // namespace util
