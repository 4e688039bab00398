#include <ai-cmdguard/exec/multi_step.hpp>
#include <cctype>
#include <sstream>

namespace cmdguard {

static std::string trim(const std::string& s){ size_t a=0; while(a<s.size() && std::isspace((unsigned char)s[a])) ++a; size_t b=s.size(); while(b>a && std::isspace((unsigned char)s[b-1])) --b; return s.substr(a,b-a); }

std::optional<MultiStepPlan> MultiStepPlan::parse(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text); std::string line;
    while (std::getline(iss, line)) {
        line = trim(line);
        if (line.empty() || line[0]=='#') continue;
        lines.push_back(line);
    }
    if (lines.size() < 2) return std::nullopt;

    MultiStepPlan plan;
    for (size_t i=0;i<lines.size();++i) {
        const std::string& l = lines[i];
        PlanStep st;
        st.command = l;
        st.number = static_cast<int>(i + 1);
        st.description = "Step " + std::to_string(i + 1) + ": " + (l.size() > 50 ? l.substr(0, 47) + "..." : l);
        st.depends_on_previous = l.find("&&") != std::string::npos
            || (i > 0 && l.find("||") == std::string::npos && l.find(';') == std::string::npos);
        plan.m_steps.push_back(std::move(st));
    }
    return plan;
}

PlanStep* MultiStepPlan::next_step() {
    if (m_current < m_steps.size()) return &m_steps[m_current];
    return nullptr;
}

bool MultiStepPlan::complete_current_step(bool success) {
    if (m_current >= m_steps.size()) return false;
    ++m_current;
    if (!success && m_current < m_steps.size() && m_steps[m_current].depends_on_previous) return false;
    return true;
}

std::string MultiStepPlan::format_for_display() const {
    std::ostringstream out;
    out << "Multi-step execution (" << m_steps.size() << " steps):\n";
    for (size_t i=0;i<m_steps.size();++i) {
        const char* mark = i < m_current ? "✓" : (i == m_current ? "→" : " ");
        out << "  " << mark << " " << m_steps[i].description;
        if (m_steps[i].mode) {
            if (auto prefix = m_steps[i].mode->display_prefix()) out << "  [" << trim(*prefix) << "]";
        }
        out << "\n";
    }
    return out.str();
}

void MultiStepPlan::evaluate(const CommandValidator& validator, const Configuration& config) {
    for (auto &st : m_steps) {
        st.validation = validator.validate(st.command);
        st.mode = resolve(config, *st.validation);
    }
}

} // namespace cmdguard
