// AI-CmdGuard main: check, ask and plan front-ends over the validation pipeline
#include <ai-cmdguard/config/config.hpp>
#include <ai-cmdguard/validate/validator.hpp>
#include <ai-cmdguard/exec/execution_mode.hpp>
#include <ai-cmdguard/exec/multi_step.hpp>
#include <ai-cmdguard/exec/shell_runner.hpp>
#include <ai-cmdguard/ai/llm.hpp>
#include <ai-cmdguard/ai/command_reply.hpp>
#include <ai-cmdguard/util/log.hpp>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

static cmdguard::AppConfig g_cfg;
static bool g_color = true;

static std::string getenv_or(const char* k, const std::string& def="") { const char* v = std::getenv(k); return v?std::string(v):def; }
static std::string apply_color(const std::string& s, const char* code){ if(!g_color) return s; return std::string("\x1b[")+code+"m"+s+"\x1b[0m"; }
static std::string join_args(const std::vector<std::string>& v){ std::string out; for(size_t i=0;i<v.size();++i){ if(i) out+=' '; out+=v[i]; } return out; }

static void usage(std::ostream& out){
    out << "Usage: ai-cmdguard [options] <check|ask|plan> ...\n"
        << "  check <command...>   validate a command and run it if allowed\n"
        << "  ask <request...>     ask the model for a command, then check it\n"
        << "  plan <file>          check and run a multi-line plan step by step\n"
        << "Options:\n"
        << "  --dry-run            show the command, never execute\n"
        << "  --auto-execute       run accepted commands without asking\n"
        << "  --safety-level <l>   low | medium | high\n"
        << "  --config <path>      rc file (default ~/.ai-cmdguardrc)\n"
        << "  -d, --debug          diagnostic output on stderr\n";
}

static bool ask_confirmation(const std::string& question){
    std::cout << question << " [y/N] " << std::flush;
    std::string resp; if(!std::getline(std::cin, resp)) { std::cout << "\n"; return false; }
    return resp=="y" || resp=="Y" || resp=="yes";
}

static void render(const cmdguard::ExecutableCommand& ec, const cmdguard::ValidationResult& verdict){
    std::string prefix = ec.mode.display_prefix().value_or("");
    const char* color = ec.mode.is_blocked() ? "1;31" : (ec.mode.is_dry_run() ? "1;33" : "1;32");
    std::cout << "Command: " << apply_color(prefix + ec.command, color) << "\n";
    if(verdict.is_rewritten()){
        std::cout << "Fixes applied:\n";
        for(auto &f: verdict.fixes) std::cout << "  - " << f << "\n";
    }
    if(verdict.is_invalid()){
        std::cout << "Problems:\n";
        for(auto &e: verdict.errors) std::cout << "  - " << cmdguard::to_string(e) << "\n";
    }
    for(auto &w: ec.warnings) std::cout << apply_color("Warning: ", "33") << w << "\n";
    if(!ec.explanation.empty()) std::cout << "\n" << ec.explanation << "\n";
    if(auto instr = ec.execution_instructions()) std::cout << "\n" << *instr << "\n";
}

// Runs the command when its mode allows, asking first when required.
static int execute_if_allowed(const cmdguard::ExecutableCommand& ec){
    if(ec.mode.is_dry_run()) return 0;
    if(ec.mode.is_blocked()) return 1;
    if(!ec.mode.can_execute()) return 0;
    if(ec.mode.requires_confirmation()){
        for(auto &r: ec.mode.confirmation_reasons()) cmdguard::log::debug("Confirmation reason: " + r);
        if(!ask_confirmation("Execute this command?")){ std::cout << "Aborted.\n"; return 1; }
    }
    int st = cmdguard::run_shell_command(ec.command);
    if(st!=0) std::cout << "Command exited with status " << st << "\n";
    return st;
}

static int handle_command(const cmdguard::CommandValidator& validator, const std::string& command, const std::string& explanation){
    auto verdict = validator.validate(command);
    cmdguard::log::debug(std::string("Validation: ") + cmdguard::to_string(verdict.kind) + " -> " + verdict.command);
    if(verdict.command == "(none)"){
        std::cout << "Command: (none)\n";
        if(!explanation.empty()) std::cout << "\n" << explanation << "\n";
        return 0;
    }
    cmdguard::ExecutableCommand ec{verdict.command, explanation, cmdguard::resolve(g_cfg.exec, verdict), {}};
    for(auto &w: verdict.warnings) ec.add_warning(cmdguard::to_string(w));
    cmdguard::log::debug(std::string("Execution mode: ") + cmdguard::to_string(ec.mode.kind));
    render(ec, verdict);
    return execute_if_allowed(ec);
}

static int run_plan(const cmdguard::CommandValidator& validator, cmdguard::MultiStepPlan& plan){
    plan.evaluate(validator, g_cfg.exec);
    std::cout << plan.format_for_display();
    int last = 0;
    while(auto *step = plan.next_step()){
        std::cout << "\n" << apply_color(step->description, "1;36") << "\n";
        cmdguard::ExecutableCommand ec{step->validation->command, "", *step->mode, {}};
        for(auto &w: step->validation->warnings) ec.add_warning(cmdguard::to_string(w));
        render(ec, *step->validation);
        last = execute_if_allowed(ec);
        bool success = last == 0;
        if(!plan.complete_current_step(success) && plan.has_more_steps()){
            std::cout << "Step " << step->number << " failed and the next step depends on it. Stopping.\n";
            break;
        }
    }
    auto [done, total] = plan.progress();
    std::cout << "\nCompleted " << done << "/" << total << " steps\n";
    return last;
}

static int cmd_check(const cmdguard::CommandValidator& validator, const std::vector<std::string>& args){
    if(args.empty()){ std::cerr << "check: missing command\n"; return 2; }
    return handle_command(validator, join_args(args), "");
}

static int cmd_plan(const cmdguard::CommandValidator& validator, const std::vector<std::string>& args){
    if(args.size()!=1){ std::cerr << "plan: expected one file\n"; return 2; }
    std::ifstream in(args[0]); if(!in){ std::cerr << "plan: cannot read " << args[0] << "\n"; return 2; }
    std::ostringstream oss; oss << in.rdbuf();
    auto plan = cmdguard::MultiStepPlan::parse(oss.str());
    if(!plan){
        // zero or one command line: plain check
        std::istringstream iss(oss.str()); std::string line;
        while(std::getline(iss,line)){ auto p=line.find_first_not_of(" \t"); if(p!=std::string::npos && line[p]!='#') return handle_command(validator, line, ""); }
        std::cerr << "plan: no commands in " << args[0] << "\n"; return 2;
    }
    return run_plan(validator, *plan);
}

static int cmd_ask(const cmdguard::CommandValidator& validator, const std::vector<std::string>& args){
    if(args.empty()){ std::cerr << "ask: missing request\n"; return 2; }
    std::string request = join_args(args);
    auto lc = cmdguard::ai::llm_config_from(g_cfg);
    auto client = cmdguard::ai::make_llm(lc);
    cmdguard::log::debug("LLM config provider="+lc.provider+" model="+lc.model+" endpoint="+lc.endpoint+" timeout="+std::to_string(lc.timeout_seconds)+"s");
    std::string shell = getenv_or("SHELL","/bin/sh"); shell = shell.substr(shell.find_last_of('/')+1);
    std::string prompt = cmdguard::ai::build_command_prompt(request, shell);

    std::optional<cmdguard::ai::LLMCompletion> reply;
    std::atomic<bool> done{false};
    std::thread worker([&]{ reply = client->complete(prompt); done = true; });
    bool spinner = isatty(STDERR_FILENO);
    if(spinner) std::cerr << "[AI] Thinking" << std::flush;
    for(int f=0; !done; ++f){
        std::this_thread::sleep_for(std::chrono::milliseconds(120));
        if(spinner && f % (1000/120)==0) std::cerr << "." << std::flush;
    }
    worker.join();
    if(spinner) std::cerr << "\n";

    if(!reply){ cmdguard::log::ai("No response from the model."); return 1; }
    cmdguard::log::debug("Source=" + reply->source);
    cmdguard::log::debug("Raw LLM response:\n" + reply->text);
    if(reply->source=="error"){
        cmdguard::log::ai("Model request failed: " + reply->text + ". Is ollama running at " + g_cfg.ollama_url + "?");
        return 1;
    }
    auto command = cmdguard::ai::extract_command(reply->text);
    std::string explanation = cmdguard::ai::extract_explanation(reply->text);
    if(!command){
        if(auto block = cmdguard::ai::extract_code_block(reply->text)){
            if(auto plan = cmdguard::MultiStepPlan::parse(*block)) return run_plan(validator, *plan);
        }
        std::cout << "Command: (none)\n";
        if(!explanation.empty()) std::cout << "\n" << explanation << "\n";
        return 0;
    }
    return handle_command(validator, *command, explanation);
}

int main(int argc, char* argv[]){
    std::vector<std::string> args(argv+1, argv+argc);
    std::string config_path;
    for(size_t i=0;i<args.size();++i){
        if(args[i]=="-d"||args[i]=="--debug") cmdguard::log::set_debug(true);
        else if(args[i]=="--config" && i+1<args.size()) config_path=args[i+1];
    }
    g_cfg = cmdguard::load_config(config_path);
    if(g_cfg.debug) cmdguard::log::set_debug(true);
    g_color = isatty(STDOUT_FILENO) && getenv_or("NO_COLOR").empty();

    size_t i=0;
    for(; i<args.size(); ++i){
        const std::string& a = args[i];
        if(a=="-d"||a=="--debug") continue;
        else if(a=="--config"){ ++i; continue; }
        else if(a=="--dry-run") g_cfg.exec.dry_run=true;
        else if(a=="--auto-execute") g_cfg.exec.auto_execute=true;
        else if(a=="--safety-level"){
            if(i+1>=args.size()){ std::cerr << "--safety-level requires a value\n"; return 2; }
            auto lvl = cmdguard::parse_safety_level(args[++i]);
            if(!lvl){ std::cerr << "Invalid safety level '" << args[i] << "' (low|medium|high)\n"; return 2; }
            g_cfg.exec.safety_level=*lvl;
        }
        else if(a=="-h"||a=="--help"){ usage(std::cout); return 0; }
        else if(!a.empty() && a[0]=='-'){ std::cerr << "Unknown option " << a << "\n"; usage(std::cerr); return 2; }
        else break;
    }
    if(i>=args.size()){ usage(std::cerr); return 2; }
    std::string sub = args[i];
    std::vector<std::string> rest(args.begin()+static_cast<long>(i)+1, args.end());
    cmdguard::log::debug(std::string("Config: safety_level=") + cmdguard::to_string(g_cfg.exec.safety_level)
        + " auto_execute=" + (g_cfg.exec.auto_execute?"true":"false") + " dry_run=" + (g_cfg.exec.dry_run?"true":"false"));

    cmdguard::CommandValidator validator;
    if(sub=="check") return cmd_check(validator, rest);
    if(sub=="ask") return cmd_ask(validator, rest);
    if(sub=="plan") return cmd_plan(validator, rest);
    std::cerr << "Unknown command '" << sub << "'\n"; usage(std::cerr);
    return 2;
}
