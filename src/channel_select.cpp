#include "lmreadout/channel_select.hpp"
#include "lmreadout/calibration.hpp"

#include <algorithm>
#include <cctype>

namespace lmreadout {

const char* to_string(SelectResult r) {
    switch (r) {
        case SelectResult::Ok:           return "ok";
        case SelectResult::Empty:        return "empty_selection";
        case SelectResult::BadCharacter: return "bad_character";
        case SelectResult::OutOfRange:   return "channel_out_of_range";
        case SelectResult::Duplicate:    return "duplicate_channel";
    }
    return "unknown";
}

static std::string normalize(const std::string& in) {
    std::string s;
    for (char c : in) {
        if (c == '"' || c == '\'') continue;
        s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a])))     ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

SelectResult parse_selection(const std::string& text, std::vector<uint8_t>& out) {
    out.clear();
    const std::string s = normalize(text);
    if (s.empty()) return SelectResult::Empty;

    if (s == "a" || s == "all") { out = {1, 2, 3, 4, 5}; return SelectResult::Ok; }
    if (s == "s" || s == "slm") { out = {1, 2, 3};       return SelectResult::Ok; }
    if (s == "l" || s == "llm") { out = {4, 5};          return SelectResult::Ok; }

    for (char c : s) {
        if (c == ' ' || c == ',' || c == '\t') continue;
        if (c < '0' || c > '9') { out.clear(); return SelectResult::BadCharacter; }

        uint8_t id = static_cast<uint8_t>(c - '0');
        if (id < LMR_CHANNEL_ID_MIN || id > LMR_CHANNEL_ID_MAX) { out.clear(); return SelectResult::OutOfRange; }
        if (std::find(out.begin(), out.end(), id) != out.end()) { out.clear(); return SelectResult::Duplicate; }
        out.push_back(id);
    }
    return out.empty() ? SelectResult::Empty : SelectResult::Ok;
}

LabelStr default_label(uint8_t id) {
    switch (id) {
        case 1: return LabelStr("SLM 1");
        case 2: return LabelStr("SLM 2");
        case 3: return LabelStr("SLM 3");
        case 4: return LabelStr("LLM (upper)");
        case 5: return LabelStr("LLM (lower)");
        case 6: return LabelStr("Reference 100 pF");
        default: {
            LabelStr l("CH ");
            l += static_cast<char>('0' + id % 10);
            return l;
        }
    }
}

ChannelList default_channels(const std::vector<uint8_t>& ids) {
    ChannelList list;
    for (uint8_t id : ids) {
        if (list.full()) break;
        Channel ch;
        ch.id     = id;
        ch.label  = default_label(id);
        ch.coeffs = calibration::identity();
        list.push_back(ch);
    }
    return list;
}

} // namespace lmreadout
