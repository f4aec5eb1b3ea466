// Anvil - Selection expressions

#include <anvil/selection.h>
#include <anvil/errors.h>
#include <algorithm>
#include <cctype>

namespace anvil {

namespace {

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

uint32_t parseIndex(const std::string& text, const std::string& expr) {
    std::string t = trim(text);
    if (t.empty() || !std::all_of(t.begin(), t.end(),
                                  [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        throw GeometryError("invalid selection '" + expr + "': expected an index, got '" + t + "'");
    }
    if (t.size() > 9) {
        throw GeometryError("invalid selection '" + expr + "': index too large");
    }
    return static_cast<uint32_t>(std::stoul(t));
}

void checkRange(uint32_t idx, size_t count, const std::string& expr) {
    if (idx >= count) {
        throw GeometryError("selection '" + expr + "' references element " + std::to_string(idx) +
                            " but only " + std::to_string(count) + " exist");
    }
}

} // anonymous namespace

std::vector<uint32_t> parseSelection(const std::string& expr, size_t count) {
    std::vector<uint32_t> result;
    std::string body = trim(expr);

    if (body.empty()) {
        return result;
    }
    if (body == "*") {
        result.resize(count);
        for (size_t i = 0; i < count; ++i) {
            result[i] = static_cast<uint32_t>(i);
        }
        return result;
    }

    size_t pos = 0;
    while (pos <= body.size()) {
        size_t comma = body.find(',', pos);
        std::string term = body.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos);
        pos = comma == std::string::npos ? body.size() + 1 : comma + 1;

        size_t dots = term.find("..");
        if (dots == std::string::npos) {
            uint32_t idx = parseIndex(term, expr);
            checkRange(idx, count, expr);
            result.push_back(idx);
            continue;
        }

        bool inclusive = dots + 2 < term.size() && term[dots + 2] == '=';
        uint32_t lo = parseIndex(term.substr(0, dots), expr);
        uint32_t hi = parseIndex(term.substr(dots + (inclusive ? 3 : 2)), expr);
        if (inclusive) {
            if (hi == UINT32_MAX) {
                throw GeometryError("invalid selection '" + expr + "': index too large");
            }
            ++hi;
        }
        if (hi <= lo) {
            continue;
        }
        checkRange(hi - 1, count, expr);
        for (uint32_t i = lo; i < hi; ++i) {
            result.push_back(i);
        }
    }

    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

std::vector<bool> selectionMask(const std::vector<uint32_t>& selection, size_t count) {
    std::vector<bool> mask(count, false);
    for (uint32_t i : selection) {
        if (i < count) {
            mask[i] = true;
        }
    }
    return mask;
}

} // namespace anvil
