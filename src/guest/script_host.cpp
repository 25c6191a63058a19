/*
 * script_host.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "script_host.hpp"

#include <pybind11/embed.h>
#include <pybind11/stl.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <mutex>
#include <thread>

namespace py = pybind11;

namespace warden::guest {

namespace {

constexpr const char* kFileName = "<sandbox>";
constexpr const char* kEntryName = "__warden_entry__";
constexpr const char* kEntryTemplate = "def __warden_entry__():\n    pass\n";
constexpr int kMaxDepth = 64;

constexpr const char* kAllowedBuiltins[] = {
    "abs", "all", "any", "ascii", "bin", "bool", "bytearray", "bytes",
    "callable", "chr", "classmethod", "complex", "dict", "divmod",
    "enumerate", "filter", "float", "format", "frozenset", "hasattr", "hash",
    "hex", "int", "isinstance", "issubclass", "iter", "len", "list", "map",
    "max", "min", "next", "object", "oct", "ord", "pow", "property", "range",
    "repr", "reversed", "round", "set", "slice", "sorted", "staticmethod",
    "str", "sum", "super", "tuple", "zip", "__build_class__",
    "Ellipsis", "NotImplemented",
    // Exception types
    "BaseException", "Exception", "ArithmeticError", "AssertionError",
    "AttributeError", "ConnectionError", "IndexError", "KeyError",
    "LookupError", "ImportError", "MemoryError", "NameError",
    "NotImplementedError", "OSError", "OverflowError", "PermissionError",
    "RecursionError", "RuntimeError", "StopIteration", "TimeoutError",
    "TypeError", "UnicodeError", "ValueError", "ZeroDivisionError",
};

constexpr const char* kGuardedBuiltins[] = {
    "eval", "exec", "compile", "open", "breakpoint", "input",
    "globals", "locals", "vars", "getattr", "setattr", "delattr",
};

constexpr const char* kRegexExports[] = {
    "compile", "match", "search", "fullmatch", "findall", "finditer",
    "sub", "subn", "split", "escape", "error", "Pattern", "Match",
    "IGNORECASE", "MULTILINE", "DOTALL", "VERBOSE", "ASCII",
    "I", "M", "S", "X", "A",
};

constexpr const char* kDatetimeExports[] = {
    "datetime", "date", "time", "timedelta", "timezone", "MINYEAR", "MAXYEAR",
};

constexpr const char* kPreloadedModules[] = {
    "ast", "math", "re", "types", "datetime", "_strptime", "time",
    "traceback", "linecache", "tokenize", "calendar", "locale",
};

// ============================================================================
// Audit hook
// ============================================================================

std::atomic<bool> gAuditArmed{false};
std::once_flag gAuditInstalled;

constexpr const char* kBlockedEvents[] = {
    "open", "compile", "exec", "code.__new__", "function.__new__",
    "object.__getattr__", "sys._getframe", "sys._current_frames",
    "sys.settrace", "sys.setprofile", "sys.addaudithook",
    "os.system", "os.listdir", "os.scandir", "os.kill", "os.killpg",
    "os.fork", "os.forkpty", "os.putenv", "os.unsetenv", "os.remove",
    "os.rename", "os.rmdir", "os.mkdir", "os.chmod", "os.chown",
    "os.truncate", "os.link", "os.symlink",
};

constexpr const char* kBlockedEventPrefixes[] = {
    "os.exec", "os.spawn", "os.posix_spawn", "subprocess.", "socket.",
    "ctypes.", "shutil.", "urllib.", "http.", "ftplib.", "smtplib.",
    "sqlite3.", "pickle.", "marshal.", "tempfile.", "webbrowser.",
};

bool isBlockedEvent(std::string_view event) {
    for (const char* name : kBlockedEvents) {
        if (event == name) return true;
    }
    for (const char* prefix : kBlockedEventPrefixes) {
        if (event.starts_with(prefix)) return true;
    }
    return false;
}

int auditHook(const char* event, PyObject* /*args*/, void* /*userData*/) {
    if (!gAuditArmed.load(std::memory_order_relaxed) || event == nullptr ||
        !isBlockedEvent(event)) {
        return 0;
    }
    PyErr_Format(PyExc_PermissionError,
                 "Operation '%s' is not permitted in sandbox", event);
    return -1;
}

/// Blocks host-reaching interpreter events while guest code runs
class AuditScope {
public:
    AuditScope() { gAuditArmed = true; }
    ~AuditScope() { gAuditArmed = false; }

    AuditScope(const AuditScope&) = delete;
    AuditScope& operator=(const AuditScope&) = delete;
};

// ============================================================================
// Conversions
// ============================================================================

[[noreturn]] void raise(PyObject* type, const std::string& message) {
    PyErr_SetString(type, message.c_str());
    throw py::error_already_set();
}

json toJson(py::handle obj, int depth) {
    if (depth > kMaxDepth) {
        return py::repr(obj).cast<std::string>();
    }
    if (obj.is_none()) {
        return nullptr;
    }
    if (py::isinstance<py::bool_>(obj)) {
        return obj.cast<bool>();
    }
    if (py::isinstance<py::int_>(obj)) {
        try {
            return obj.cast<int64_t>();
        } catch (const py::cast_error&) {
            return py::str(obj).cast<std::string>();
        }
    }
    if (py::isinstance<py::float_>(obj)) {
        double value = obj.cast<double>();
        if (!std::isfinite(value)) {
            return nullptr;
        }
        return value;
    }
    if (py::isinstance<py::str>(obj)) {
        return obj.cast<std::string>();
    }
    if (py::isinstance<py::dict>(obj)) {
        json result = json::object();
        for (auto item : py::reinterpret_borrow<py::dict>(obj)) {
            std::string key = py::isinstance<py::str>(item.first)
                                  ? item.first.cast<std::string>()
                                  : py::str(item.first).cast<std::string>();
            result[key] = toJson(item.second, depth + 1);
        }
        return result;
    }
    if (py::isinstance<py::list>(obj) || py::isinstance<py::tuple>(obj) ||
        py::isinstance<py::set>(obj) || py::isinstance<py::frozenset>(obj)) {
        json result = json::array();
        for (auto item : py::reinterpret_borrow<py::iterable>(obj)) {
            result.push_back(toJson(item, depth + 1));
        }
        return result;
    }
    return py::repr(obj).cast<std::string>();
}

py::object fromJson(const json& value) {
    switch (value.type()) {
        case json::value_t::null:
            return py::none();
        case json::value_t::boolean:
            return py::bool_(value.get<bool>());
        case json::value_t::number_integer:
            return py::int_(value.get<int64_t>());
        case json::value_t::number_unsigned:
            return py::int_(value.get<uint64_t>());
        case json::value_t::number_float:
            return py::float_(value.get<double>());
        case json::value_t::string:
            return py::str(value.get<std::string>());
        case json::value_t::array: {
            py::list list;
            for (const auto& item : value) {
                list.append(fromJson(item));
            }
            return list;
        }
        case json::value_t::object: {
            py::dict dict;
            for (const auto& [key, item] : value.items()) {
                dict[py::str(key)] = fromJson(item);
            }
            return dict;
        }
        case json::value_t::binary: {
            const auto& bytes = value.get_binary();
            return py::bytes(reinterpret_cast<const char*>(bytes.data()),
                             bytes.size());
        }
        default:
            return py::none();
    }
}

std::string describeException(py::handle type, py::handle value) {
    std::string name = "Exception";
    std::string message;
    try {
        if (type) {
            name = py::str(type.attr("__name__")).cast<std::string>();
        }
        if (value && !value.is_none()) {
            message = py::str(value).cast<std::string>();
        }
    } catch (const py::error_already_set&) {
        message = "<unprintable exception>";
    }
    return message.empty() ? name : name + ": " + message;
}

std::optional<std::string> formatTraceback(py::handle type, py::handle value,
                                           py::handle trace) {
    try {
        auto lines = py::module_::import("traceback")
                         .attr("format_exception")(type, value, trace);
        return py::str("").attr("join")(lines).cast<std::string>();
    } catch (const py::error_already_set&) {
        return std::nullopt;
    }
}

std::string joinArgs(const py::args& args, const std::string& separator) {
    std::string message;
    bool first = true;
    for (auto arg : args) {
        if (!first) {
            message += separator;
        }
        message += py::str(arg).cast<std::string>();
        first = false;
    }
    return message;
}

py::object makeNamespace(const py::dict& members) {
    return py::module_::import("types").attr("SimpleNamespace")(**members);
}

template <size_t N>
py::object proxyOf(const char* moduleName, const char* const (&names)[N]) {
    py::module_ module = py::module_::import(moduleName);
    py::dict members;
    for (const char* name : names) {
        if (py::hasattr(module, name)) {
            members[name] = module.attr(name);
        }
    }
    return makeNamespace(members);
}

}  // namespace

// ============================================================================
// ScriptHost::Impl
// ============================================================================

class ScriptHost::Impl {
public:
    Impl(GuestBridge bridge, sandbox::MetricsMonitor& monitor,
         ScriptHostOptions options)
        : bridge_(std::move(bridge)), monitor_(monitor), options_(options) {
        std::call_once(gAuditInstalled, [] {
            if (PySys_AddAuditHook(auditHook, nullptr) != 0) {
                PyErr_Clear();
            }
        });

        py::module_ sys = py::module_::import("sys");
        previousUnraisableHook_ = sys.attr("unraisablehook");
        sys.attr("unraisablehook") = py::cpp_function(
            [this](py::object args) { reportUnraisable(args); });
    }

    ~Impl() {
        try {
            py::module_::import("sys").attr("unraisablehook") =
                previousUnraisableHook_;
        } catch (py::error_already_set& e) {
            e.discard_as_unraisable("restoring sys.unraisablehook");
        }
    }

    RunOutcome run(std::string_view code, const json& context) {
        RunOutcome outcome;
        networkLimitHit_ = false;

        try {
            py::module_ ast = py::module_::import("ast");
            py::module_ builtins = py::module_::import("builtins");

            py::object wrapper = ast.attr("parse")(kEntryTemplate, kFileName, "exec");
            py::object parsed = ast.attr("parse")(
                py::str(code.data(), code.size()), kFileName, "exec");

            py::list body = parsed.attr("body");
            if (py::len(body) > 0) {
                py::list(wrapper.attr("body"))[0].attr("body") = body;
            }
            ast.attr("fix_missing_locations")(wrapper);

            py::object compiled =
                builtins.attr("compile")(wrapper, kFileName, "exec");
            py::dict globals = buildGlobals(context);
            builtins.attr("exec")(compiled, globals);
            py::object entry = globals.attr("pop")(kEntryName);

            py::object value;
            {
                AuditScope armed;
                value = entry();
            }

            outcome.result = toJson(value, 0);
            outcome.success = true;
        } catch (const py::error_already_set& e) {
            outcome.success = false;
            outcome.error = describeException(e.type(), e.value());
            outcome.stack = formatTraceback(e.type(), e.value(), e.trace());
        } catch (const std::exception& e) {
            outcome.success = false;
            outcome.error = std::string("RuntimeError: ") + e.what();
        }

        outcome.networkLimitHit = networkLimitHit_;
        return outcome;
    }

private:
    py::dict buildBuiltins() {
        py::dict source = py::module_::import("builtins").attr("__dict__");
        py::dict restricted;

        for (const char* name : kAllowedBuiltins) {
            if (source.contains(name)) {
                restricted[name] = source[name];
            }
        }

        for (const char* name : kGuardedBuiltins) {
            std::string message = std::string(name) + " is disabled in sandbox";
            restricted[name] = py::cpp_function(
                [message](py::args, py::kwargs) -> py::object {
                    raise(PyExc_PermissionError, message);
                },
                py::name(name));
        }

        restricted["__import__"] = py::cpp_function(
            [](py::args, py::kwargs) -> py::object {
                raise(PyExc_ImportError, "Module imports are disabled in sandbox");
            },
            py::name("__import__"));

        restricted["print"] = py::cpp_function(
            [this](py::args args, py::kwargs kwargs) {
                std::string separator = " ";
                if (kwargs.contains("sep") && !kwargs["sep"].is_none()) {
                    separator = py::str(kwargs["sep"]).cast<std::string>();
                }
                forwardConsole("log", joinArgs(args, separator));
            },
            py::name("print"));

        return restricted;
    }

    py::object buildConsole() {
        py::dict members;
        for (const char* level : {"log", "info", "warn", "error", "debug"}) {
            std::string levelName(level);
            members[level] = py::cpp_function(
                [this, levelName](py::args args) {
                    forwardConsole(levelName, joinArgs(args, " "));
                },
                py::name(level));
        }
        return makeNamespace(members);
    }

    py::object buildJsonProxy() {
        py::dict members;
        members["dumps"] = py::cpp_function(
            [](py::object value, py::object indent) {
                json converted = toJson(value, 0);
                int width = indent.is_none() ? -1 : indent.cast<int>();
                try {
                    return converted.dump(width);
                } catch (const json::exception& e) {
                    raise(PyExc_ValueError, e.what());
                }
            },
            py::arg("obj"), py::arg("indent") = py::none());
        members["loads"] = py::cpp_function(
            [](const std::string& text) {
                try {
                    return fromJson(json::parse(text));
                } catch (const json::parse_error& e) {
                    raise(PyExc_ValueError, e.what());
                }
            },
            py::arg("s"));
        return makeNamespace(members);
    }

    py::object buildMathProxy() {
        py::dict source = py::module_::import("math").attr("__dict__");
        py::dict members;
        for (auto item : source) {
            auto name = item.first.cast<std::string>();
            if (!name.starts_with("_")) {
                members[item.first] = item.second;
            }
        }
        return makeNamespace(members);
    }

    py::dict buildGlobals(const json& context) {
        py::dict globals;
        globals["__builtins__"] = buildBuiltins();
        globals["__name__"] = "__sandbox__";
        globals["console"] = buildConsole();
        globals["fetch"] = py::cpp_function(
            [this](const std::string& url, py::object options) {
                return fetch(url, options);
            },
            py::arg("url"), py::arg("options") = py::none());
        globals["sleep"] = py::cpp_function(
            [](double seconds) {
                if (seconds < 0) {
                    raise(PyExc_ValueError, "sleep length must be non-negative");
                }
                py::gil_scoped_release release;
                std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
            },
            py::arg("seconds"));
        globals["math"] = buildMathProxy();
        globals["json"] = buildJsonProxy();
        globals["datetime"] = proxyOf("datetime", kDatetimeExports);
        globals["re"] = proxyOf("re", kRegexExports);
        if (context.is_object()) {
            globals["context"] = fromJson(context);
        } else {
            globals["context"] = py::dict();
        }
        return globals;
    }

    void forwardConsole(std::string_view level, const std::string& message) {
        if (bridge_.console) {
            bridge_.console(level, message);
        }
    }

    py::object fetch(const std::string& url, const py::object& options) {
        auto attempts = monitor_.recordNetworkRequest();
        if (attempts > options_.networkRequestCap) {
            networkLimitHit_ = true;
            raise(PyExc_PermissionError,
                  std::string(sandbox::limitViolationToString(
                      sandbox::LimitViolation::NetworkRequests)));
        }
        if (!options_.networkAccess) {
            raise(PyExc_PermissionError,
                  "Network access is disabled for this execution");
        }

        sandbox::NetworkRequest request;
        request.url = url;
        if (!options.is_none()) {
            if (!py::isinstance<py::dict>(options)) {
                raise(PyExc_TypeError, "fetch options must be a dict");
            }
            auto opts = py::reinterpret_borrow<py::dict>(options);
            if (opts.contains("method")) {
                request.method = py::str(opts["method"]).cast<std::string>();
            }
            if (opts.contains("headers")) {
                json headers = toJson(opts["headers"], 0);
                if (headers.is_object()) {
                    request.headers = std::move(headers);
                }
            }
            if (opts.contains("body") && !opts["body"].is_none()) {
                py::object body = opts["body"];
                if (py::isinstance<py::bytes>(body) || py::isinstance<py::str>(body)) {
                    request.body = body.cast<std::string>();
                } else {
                    request.body = toJson(body, 0).dump();
                }
            }
        }
        monitor_.recordNetworkBytes(request.body.size());

        std::optional<sandbox::NetworkResponse> response;
        {
            py::gil_scoped_release release;
            response = bridge_.fetch ? bridge_.fetch(request)
                                     : sandbox::denyNetworkRequest(request);
        }
        if (!response) {
            raise(PyExc_ConnectionError, "Network relay unavailable");
        }
        monitor_.recordNetworkBytes(response->body.size());

        py::dict result;
        result["ok"] = response->ok;
        result["status"] = response->status;
        result["body"] = response->body;
        result["headers"] = fromJson(response->headers);
        if (!response->error.empty()) {
            result["error"] = response->error;
        }
        return result;
    }

    void reportUnraisable(const py::object& args) {
        py::object type = args.attr("exc_type");
        py::object value = args.attr("exc_value");
        py::object trace = args.attr("exc_traceback");

        std::string error = describeException(type, value);
        auto stack = formatTraceback(type, value, trace);
        if (bridge_.diagnostic) {
            bridge_.diagnostic(error, stack.value_or(""));
        }
    }

    GuestBridge bridge_;
    sandbox::MetricsMonitor& monitor_;
    ScriptHostOptions options_;
    bool networkLimitHit_{false};
    py::object previousUnraisableHook_;
};

// ============================================================================
// ScriptHost
// ============================================================================

ScriptHost::ScriptHost(GuestBridge bridge, sandbox::MetricsMonitor& monitor,
                       ScriptHostOptions options)
    : pImpl_(std::make_unique<Impl>(std::move(bridge), monitor, options)) {}

ScriptHost::~ScriptHost() = default;

RunOutcome ScriptHost::run(std::string_view code, const json& context) {
    return pImpl_->run(code, context);
}

void ScriptHost::preloadModules() {
    for (const char* name : kPreloadedModules) {
        try {
            py::module_::import(name);
        } catch (py::error_already_set& e) {
            e.discard_as_unraisable(name);
        }
    }
}

}  // namespace warden::guest
