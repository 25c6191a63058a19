/*
 * sanitizer.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "sanitizer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <format>
#include <regex>

namespace warden::sandbox {

namespace {

/**
 * @brief Denylist entry
 *
 * Rules with capturesPrefix match one leading character in group 1 that
 * is kept, so method calls such as `re.compile(` survive.
 */
struct DenyRule {
    const char* category;
    const char* pattern;
    const char* reason;
    bool capturesPrefix;
};

constexpr DenyRule kRules[] = {
    // Dynamic evaluation
    {"dynamic-evaluation", R"(eval\s*\()", "evaluates a string as code", false},
    {"dynamic-evaluation", R"(exec\s*\()", "executes a string as code", false},
    {"dynamic-evaluation", R"((^|[^.\w])compile\s*\()", "builds code objects at runtime", true},
    {"dynamic-evaluation", R"(\bbreakpoint\s*\()", "enters the debugger", false},

    // Dynamic module loading
    {"module-loading", R"(__import__)", "imports modules dynamically", false},
    {"module-loading", R"(\bimportlib\b)", "imports modules dynamically", false},
    {"module-loading",
     R"(\b(?:import|from)\s+(?:os|sys|subprocess|ctypes|socket|shutil|importlib|builtins|pickle|marshal|multiprocessing|threading|signal|pathlib|io|gc|inspect|code|pty|resource|mmap|fcntl|posix)\b)",
     "imports a host module", false},

    // Direct host access
    {"host-access", R"(\bos\s*\.)", "touches the host operating system", false},
    {"host-access", R"(\bsys\s*\.)", "touches interpreter internals", false},
    {"host-access", R"(\bsubprocess\b)", "starts host processes", false},
    {"host-access", R"(\bctypes\b)", "calls native code", false},
    {"host-access", R"(\bmultiprocessing\b)", "starts host processes", false},
    {"host-access", R"(\bthreading\b)", "starts threads outside the monitor", false},
    {"host-access", R"(\bsignal\s*\.)", "changes process signal handling", false},

    // Storage
    {"storage", R"((^|[^.\w])open\s*\()", "opens host files", true},
    {"storage", R"(\b(?:pathlib|shutil|sqlite3|shelve|pickle|marshal|tempfile)\b)",
     "reads or writes host storage", false},

    // Networking outside the monitored fetch path
    {"networking", R"(\bsocket\b)", "opens raw sockets", false},
    {"networking", R"(\burllib\w*)", "bypasses the monitored fetch", false},
    {"networking", R"(\bhttp\s*\.\s*client\b)", "bypasses the monitored fetch", false},
    {"networking", R"(\brequests\s*\.)", "bypasses the monitored fetch", false},
    {"networking", R"(\b(?:ssl|ftplib|smtplib|telnetlib|poplib|imaplib)\b)",
     "bypasses the monitored fetch", false},
    {"networking", R"(\basyncio\s*\.\s*open_connection\b)", "opens raw sockets", false},

    // Interpreter escape hatches
    {"introspection",
     R"(__(?:subclasses|globals|builtins|code|closure|mro|bases|loader|spec|self)__)",
     "reaches objects outside the sandbox scope", false},
    {"introspection", R"(\b(?:globals|locals|vars)\s*\()",
     "exposes namespace dictionaries", false},
    {"introspection", R"(\b(?:getattr|setattr|delattr)\s*\()",
     "resolves attributes by computed name", false},
};

// Every pass removes at least one match and the marker itself matches no
// rule, so this bound is never reached for real input.
constexpr int kMaxPasses = 16;

struct CompiledRule {
    const DenyRule* rule;
    std::regex regex;
};

const std::vector<CompiledRule>& compiledRules() {
    static const std::vector<CompiledRule> rules = [] {
        std::vector<CompiledRule> compiled;
        compiled.reserve(std::size(kRules));
        for (const auto& rule : kRules) {
            compiled.push_back({&rule, std::regex(rule.pattern)});
        }
        return compiled;
    }();
    return rules;
}

int lineOf(const std::string& text, size_t position) {
    return 1 + static_cast<int>(std::count(text.begin(),
                                           text.begin() + static_cast<std::ptrdiff_t>(position),
                                           '\n'));
}

std::string lineText(const std::string& text, size_t position) {
    auto begin = text.rfind('\n', position == 0 ? 0 : position - 1);
    begin = (begin == std::string::npos || position == 0) ? 0 : begin + 1;
    auto end = text.find('\n', position);
    return text.substr(begin, end == std::string::npos ? std::string::npos
                                                       : end - begin);
}

bool applyRule(const CompiledRule& compiled, std::string& code,
               std::vector<Removal>* removals) {
    auto begin = std::sregex_iterator(code.begin(), code.end(), compiled.regex);
    auto end = std::sregex_iterator();
    if (begin == end) {
        return false;
    }

    std::string next;
    next.reserve(code.size());
    size_t last = 0;

    for (auto it = begin; it != end; ++it) {
        const auto& match = *it;
        size_t prefix = compiled.rule->capturesPrefix
                            ? static_cast<size_t>(match.length(1))
                            : 0;
        size_t start = static_cast<size_t>(match.position(0)) + prefix;
        size_t stop = static_cast<size_t>(match.position(0) + match.length(0));

        next.append(code, last, start - last);
        next.append(Sanitizer::MARKER);
        if (stop > start && (code[stop - 1] == '(' || code[stop - 1] == '.')) {
            next.push_back(code[stop - 1]);
        }
        last = stop;

        if (removals != nullptr) {
            Removal removal;
            removal.category = compiled.rule->category;
            removal.match = code.substr(start, stop - start);
            removal.reason = compiled.rule->reason;
            removal.line = lineOf(code, start);
            removal.context = lineText(code, start);
            removals->push_back(std::move(removal));
        }
    }
    next.append(code, last, std::string::npos);
    code = std::move(next);
    return true;
}

void filter(std::string& code, std::vector<Removal>* removals) {
    for (int pass = 0; pass < kMaxPasses; ++pass) {
        bool changed = false;
        for (const auto& compiled : compiledRules()) {
            changed = applyRule(compiled, code, removals) || changed;
        }
        if (!changed) {
            return;
        }
    }
}

}  // namespace

std::vector<std::string> SanitizeReport::warnings() const {
    std::vector<std::string> result;
    result.reserve(removals.size());
    for (const auto& removal : removals) {
        result.push_back(std::format("Removed {} construct '{}' at line {}",
                                     removal.category, removal.match,
                                     removal.line));
    }
    return result;
}

std::string Sanitizer::sanitize(std::string_view code) noexcept {
    try {
        std::string result(code);
        filter(result, nullptr);
        return result;
    } catch (const std::exception& e) {
        // regex_error (complexity/stack) on pathological input, or bad_alloc
        spdlog::warn("Sanitizer rejected input of {} bytes: {}", code.size(),
                     e.what());
        return std::string(MARKER);
    }
}

SanitizeReport Sanitizer::sanitizeWithReport(std::string_view code) {
    SanitizeReport report;
    report.code = std::string(code);
    try {
        filter(report.code, &report.removals);
    } catch (const std::regex_error& e) {
        spdlog::warn("Sanitizer rejected input of {} bytes: {}", code.size(),
                     e.what());
        report.code = std::string(MARKER);
        report.removals.push_back(
            {"unscannable", std::string(code.substr(0, 32)),
             "input could not be scanned", 1, std::nullopt});
    }
    if (report.modified()) {
        spdlog::debug("Sanitizer removed {} construct(s)", report.removals.size());
    }
    return report;
}

std::vector<std::string> Sanitizer::categories() {
    std::vector<std::string> result;
    for (const auto& rule : kRules) {
        if (std::find(result.begin(), result.end(), rule.category) == result.end()) {
            result.emplace_back(rule.category);
        }
    }
    return result;
}

}  // namespace warden::sandbox
