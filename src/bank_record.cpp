#include "bank_record.hpp"
#include "util.hpp"
#include <cctype>

namespace bankmatch {

bool is_valid_code(const std::string& code) {
    return code.size() == kCodeLength && is_digits(code);
}

void validate_record(const BankRecord& record) {
    if (trim(record.bank_name).empty())
        throw RecordError("bank_name must not be empty");
    if (!is_valid_code(record.bank_code))
        throw RecordError("bank_code must be 12 digits: '" + record.bank_code + "'");
    if (!is_valid_code(record.clearing_code))
        throw RecordError("clearing_code must be 12 digits: '" + record.clearing_code + "'");
}

// CJK symbols and general punctuation that never carry meaning in a name.
static bool is_cjk_punct(char32_t cp) {
    if (cp >= 0x3005 && cp <= 0x3007) return false; // 々〆〇 are letters
    if (cp >= 0x3000 && cp <= 0x303F) return true;  // CJK symbols and punctuation
    if (cp >= 0x2010 && cp <= 0x205F) return true;  // general punctuation, incl. spaces
    if (cp == 0x00A0 || cp == 0x00B7) return true;  // nbsp, middle dot
    if (cp >= 0xFE30 && cp <= 0xFE4F) return true;  // CJK compatibility forms
    if (cp == 0xFF5F || cp == 0xFF60 || (cp >= 0xFF61 && cp <= 0xFF65)) return true;
    return false;
}

// Fold one code point. Returns 0 for separators (whitespace, punctuation).
static char32_t fold(char32_t cp) {
    // Fullwidth forms U+FF01..U+FF5E map onto ASCII 0x21..0x7E
    if (cp >= 0xFF01 && cp <= 0xFF5E) cp -= 0xFEE0;

    if (cp < 0x80) {
        auto c = static_cast<unsigned char>(cp);
        if (std::isspace(c) || std::ispunct(c) || std::iscntrl(c)) return 0;
        if (c >= 'A' && c <= 'Z') return static_cast<char32_t>(c - 'A' + 'a');
        return cp;
    }
    if (is_cjk_punct(cp) || cp == 0xFFFD) return 0;
    return cp;
}

std::string normalize_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char32_t cp : decode_utf8(name)) {
        char32_t f = fold(cp);
        if (f != 0) append_utf8(out, f);
    }
    return out;
}

std::vector<std::string> normalized_segments(const std::string& text) {
    std::vector<std::string> segs;
    std::string cur;
    for (char32_t cp : decode_utf8(text)) {
        char32_t f = fold(cp);
        if (f == 0) {
            if (!cur.empty()) segs.push_back(std::move(cur));
            cur.clear();
            continue;
        }
        append_utf8(cur, f);
    }
    if (!cur.empty()) segs.push_back(std::move(cur));
    return segs;
}

std::string document_text(const BankRecord& record) {
    std::string text = "银行名称: " + record.bank_name + " | 联行号: " + record.bank_code;
    if (!record.clearing_code.empty()) text += " | 清算代码: " + record.clearing_code;
    return text;
}

} // namespace bankmatch
