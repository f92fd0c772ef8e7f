#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace bankmatch {

// Length of both numeric identifiers on a record.
constexpr size_t kCodeLength = 12;

struct BankRecord {
    int64_t id = 0;             // assigned by the record store
    std::string bank_name;      // legal branch name
    std::string bank_code;      // 联行号, 12 digits
    std::string clearing_code;  // 清算代码, 12 digits
};

// Thrown when a record violates the ingestion invariants.
class RecordError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// True if code is exactly kCodeLength ASCII digits.
bool is_valid_code(const std::string& code);

// Throws RecordError describing the first violated invariant.
void validate_record(const BankRecord& record);

// Canonical form used for name equality: fullwidth ASCII folded to ASCII,
// ASCII lowercased, whitespace and punctuation (ASCII and CJK) removed.
std::string normalize_name(const std::string& name);

// Same folding as normalize_name, but split where separators were.
// Concatenating the pieces gives normalize_name(text).
std::vector<std::string> normalized_segments(const std::string& text);

// Text handed to the embedder for a record.
std::string document_text(const BankRecord& record);

} // namespace bankmatch
