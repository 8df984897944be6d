#include "quotes/QuoteUtil.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace quotes {

static bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

static std::string trim_blanks(const std::string& s) {
    size_t a = 0;
    while (a < s.size() && (s[a] == ' ' || s[a] == '\t')) ++a;

    size_t b = s.size();
    while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t')) --b;

    return s.substr(a, b - a);
}

std::string normalize_vendor_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c != '\n') out.push_back(c);
    }

    static const char* const suffixes[] = {
        " \xE2\x80\xA2",          // " •"
        " ECIA (NEDA) Member",
        " CEDA member",
    };
    for (const char* suffix : suffixes) {
        if (ends_with(out, suffix)) {
            out.erase(out.size() - std::string(suffix).size());
        }
    }

    return trim_blanks(out);
}

void normalize_quote(catalog::VendorQuote& quote) {
    quote.vendor_name = normalize_vendor_name(quote.vendor_name);
    std::stable_sort(quote.price_breaks.begin(), quote.price_breaks.end(),
                     [](const catalog::PriceBreak& a, const catalog::PriceBreak& b) {
                         if (a.min_quantity != b.min_quantity) return a.min_quantity < b.min_quantity;
                         return a.unit_price < b.unit_price;
                     });
}

std::vector<catalog::PriceBreak> parse_price_breaks(const std::string& text) {
    std::vector<catalog::PriceBreak> out;

    std::istringstream in(text);
    std::string pair;
    while (in >> pair) {
        const size_t slash = pair.find('/');
        if (slash == std::string::npos || pair.find('/', slash + 1) != std::string::npos) {
            throw std::invalid_argument("price break '" + pair + "' is not of the form quantity/price");
        }

        const std::string qty_text = pair.substr(0, slash);
        const std::string price_text = pair.substr(slash + 1);

        catalog::PriceBreak pb;
        size_t used = 0;
        try {
            pb.min_quantity = std::stoi(qty_text, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (qty_text.empty() || used != qty_text.size() || pb.min_quantity < 0) {
            throw std::invalid_argument("quantity '" + qty_text + "' is not a non-negative integer");
        }

        used = 0;
        try {
            pb.unit_price = std::stod(price_text, &used);
        } catch (const std::exception&) {
            used = 0;
        }
        if (price_text.empty() || used != price_text.size()) {
            throw std::invalid_argument("price '" + price_text + "' is not a number");
        }

        out.push_back(pb);
    }

    return out;
}

// bytes outside [A-Za-z0-9.-] become %XX, so "__" never occurs inside a field
static void append_safe(std::string& out, const std::string& s) {
    static const char* const hex = "0123456789ABCDEF";
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '.' || c == '-') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
}

std::string file_safe_name(const catalog::ActualPartKey& key) {
    std::string out;
    append_safe(out, key.manufacturer_name);
    out += "__";
    append_safe(out, key.manufacturer_part_name);
    return out;
}

std::string format_money(double amount) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << amount;
    return oss.str();
}

std::int64_t epoch_seconds_now() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

}  // namespace quotes
