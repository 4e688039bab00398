// Validation verdict types shared by the validator and the execution mode resolver.
#pragma once
#include <string>
#include <vector>

namespace cmdguard {

struct ValidationError {
    enum class Kind {
        HallucinatedFlag,      // flag invented by the model
        PlaceholderDetected,   // unfilled template text
        SyntaxError,
        QuotingIssue
    };
    Kind kind;
    std::string detail;        // the flag, the placeholder text or the message

    static ValidationError hallucinated_flag(std::string flag) { return {Kind::HallucinatedFlag, std::move(flag)}; }
    static ValidationError placeholder(std::string text) { return {Kind::PlaceholderDetected, std::move(text)}; }
    static ValidationError syntax(std::string msg) { return {Kind::SyntaxError, std::move(msg)}; }
    static ValidationError quoting(std::string msg) { return {Kind::QuotingIssue, std::move(msg)}; }

    bool operator==(const ValidationError&) const = default;
};

struct SecurityWarning {
    enum class Kind {
        DataLoss,
        SystemModification,
        DangerousPattern
    };
    Kind kind;
    std::string message;

    bool operator==(const SecurityWarning&) const = default;
};

// Exactly one of Valid, Rewritten, Invalid, Sensitive. Only the vector that
// belongs to the kind is populated.
struct ValidationResult {
    enum class Kind { Valid, Rewritten, Invalid, Sensitive };
    Kind kind = Kind::Valid;
    std::string command;
    std::vector<std::string> fixes;             // Rewritten
    std::vector<ValidationError> errors;        // Invalid
    std::vector<SecurityWarning> warnings;      // Sensitive

    static ValidationResult valid(std::string cmd);
    static ValidationResult rewritten(std::string cmd, std::vector<std::string> fixes);
    static ValidationResult invalid(std::string cmd, std::vector<ValidationError> errors);
    static ValidationResult sensitive(std::string cmd, std::vector<SecurityWarning> warnings);

    bool is_valid() const { return kind == Kind::Valid; }
    bool is_rewritten() const { return kind == Kind::Rewritten; }
    bool is_invalid() const { return kind == Kind::Invalid; }
    bool is_sensitive() const { return kind == Kind::Sensitive; }
    // Valid or Rewritten: the command may be shown as runnable
    bool is_acceptable() const { return is_valid() || is_rewritten(); }

    bool operator==(const ValidationResult&) const = default;
};

// Human readable forms, e.g. "Hallucinated flag: --hidden"
std::string to_string(const ValidationError& e);
std::string to_string(const SecurityWarning& w);
const char* to_string(ValidationResult::Kind k);

} // namespace cmdguard
