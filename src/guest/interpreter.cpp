/*
 * interpreter.cpp
 *
 * Copyright (C) 2024 The warden authors
 */

#include "interpreter.hpp"

#include <pybind11/embed.h>

#include <optional>

namespace py = pybind11;

namespace warden::guest {

class InterpreterScope::Impl {
public:
    Impl() {
        if (Py_IsInitialized()) {
            return;
        }

        PyConfig config;
        PyConfig_InitIsolatedConfig(&config);
        config.site_import = 0;
        config.install_signal_handlers = 0;
        config.write_bytecode = 0;

        // pybind11 clears the config itself when initialization fails
        interpreter_.emplace(&config, 0, nullptr, false);
        PyConfig_Clear(&config);
    }

    std::optional<py::scoped_interpreter> interpreter_;
};

InterpreterScope::InterpreterScope() : pImpl_(std::make_unique<Impl>()) {}

InterpreterScope::~InterpreterScope() = default;

bool InterpreterScope::ownsInterpreter() const noexcept {
    return pImpl_->interpreter_.has_value();
}

std::string InterpreterScope::pythonVersion() {
    std::string version = Py_GetVersion();
    auto space = version.find(' ');
    return space == std::string::npos ? version : version.substr(0, space);
}

InterpreterForkGuard::InterpreterForkGuard() {
    if (!Py_IsInitialized()) {
        return;
    }
    gilState_ = static_cast<int>(PyGILState_Ensure());
    PyOS_BeforeFork();
    active_ = true;
}

InterpreterForkGuard::~InterpreterForkGuard() {
    if (active_ && !resolved_) {
        afterForkParent();
    }
}

void InterpreterForkGuard::afterForkChild() noexcept {
    if (!active_ || resolved_) {
        return;
    }
    resolved_ = true;
    PyOS_AfterFork_Child();
    // The child keeps the GIL; the forking thread is its only thread
}

void InterpreterForkGuard::afterForkParent() noexcept {
    if (!active_ || resolved_) {
        return;
    }
    resolved_ = true;
    PyOS_AfterFork_Parent();
    PyGILState_Release(static_cast<PyGILState_STATE>(gilState_));
}

}  // namespace warden::guest
