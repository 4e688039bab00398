/*
 * AI-CmdGuard Configuration
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Execution policy (dry run, auto execute, safety level) plus the settings
 *   of the model round-trip. Loaded from a key=value rc file:
 *
 *     # ~/.ai-cmdguardrc
 *     provider=ollama
 *     model=mistral
 *     ollama_url=http://localhost:11434
 *     ai_timeout=120
 *     auto_execute=false
 *     dry_run=false
 *     safety_level=medium
 *     debug=false
 *
 *   The path can be overridden with AI_CMDGUARD_CONFIG. A file that fails
 *   validation is replaced by the defaults with a warning on stderr.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <string>
#include <optional>

namespace cmdguard {

enum class SafetyLevel { Low, Medium, High };

// "low" | "medium" | "high", case-insensitive
std::optional<SafetyLevel> parse_safety_level(const std::string& s);
const char* to_string(SafetyLevel level);

// What the resolver needs to decide how a command may run.
struct Configuration {
    bool dry_run = false;
    bool auto_execute = false;          // never run without asking unless set
    SafetyLevel safety_level = SafetyLevel::Medium;
};

struct AppConfig {
    Configuration exec;
    std::string provider = "ollama";    // ollama | stub
    std::string model = "mistral";
    std::string ollama_url = "http://localhost:11434";
    int ai_timeout = 120;               // seconds
    std::string stub_file;              // canned model reply (stub provider)
    bool debug = false;
};

// 1|true|on|yes
bool parse_bool(const std::string& value);

// $AI_CMDGUARD_CONFIG, else $HOME/.ai-cmdguardrc; empty when neither is set
std::string default_config_path();

// Applies the key=value lines of `path` on top of `cfg`. Returns false when
// the file cannot be opened; `cfg` is left untouched in that case.
bool load_config_file(const std::string& path, AppConfig& cfg);

// First problem found, or nothing when the configuration is usable.
std::optional<std::string> validate_config(const AppConfig& cfg);

// Loads `path` (or the default path when empty) and validates the result,
// falling back to AppConfig{} with a warning when validation fails.
AppConfig load_config(const std::string& path = {});

} // namespace cmdguard
