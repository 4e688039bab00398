#include <ai-cmdguard/validate/validation_result.hpp>

namespace cmdguard {

ValidationResult ValidationResult::valid(std::string cmd) {
    ValidationResult r; r.kind = Kind::Valid; r.command = std::move(cmd); return r;
}

ValidationResult ValidationResult::rewritten(std::string cmd, std::vector<std::string> fixes) {
    ValidationResult r; r.kind = Kind::Rewritten; r.command = std::move(cmd); r.fixes = std::move(fixes); return r;
}

ValidationResult ValidationResult::invalid(std::string cmd, std::vector<ValidationError> errors) {
    ValidationResult r; r.kind = Kind::Invalid; r.command = std::move(cmd); r.errors = std::move(errors); return r;
}

ValidationResult ValidationResult::sensitive(std::string cmd, std::vector<SecurityWarning> warnings) {
    ValidationResult r; r.kind = Kind::Sensitive; r.command = std::move(cmd); r.warnings = std::move(warnings); return r;
}

std::string to_string(const ValidationError& e) {
    switch (e.kind) {
        case ValidationError::Kind::HallucinatedFlag: return "Hallucinated flag: " + e.detail;
        case ValidationError::Kind::PlaceholderDetected: return "Placeholder detected: " + e.detail;
        case ValidationError::Kind::SyntaxError: return "Syntax error: " + e.detail;
        case ValidationError::Kind::QuotingIssue: return "Quoting issue: " + e.detail;
    }
    return e.detail;
}

std::string to_string(const SecurityWarning& w) {
    switch (w.kind) {
        case SecurityWarning::Kind::DataLoss: return "Data Loss Risk: " + w.message;
        case SecurityWarning::Kind::SystemModification: return "System Modification: " + w.message;
        case SecurityWarning::Kind::DangerousPattern: return "Dangerous Pattern: " + w.message;
    }
    return w.message;
}

const char* to_string(ValidationResult::Kind k) {
    switch (k) {
        case ValidationResult::Kind::Valid: return "valid";
        case ValidationResult::Kind::Rewritten: return "rewritten";
        case ValidationResult::Kind::Invalid: return "invalid";
        case ValidationResult::Kind::Sensitive: return "sensitive";
    }
    return "?";
}

} // namespace cmdguard
