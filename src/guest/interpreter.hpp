/*
 * interpreter.hpp
 *
 * Copyright (C) 2024 The warden authors
 */

/**
 * @file interpreter.hpp
 * @brief Embedded interpreter lifetime for sandbox processes
 * @date 2024
 * @version 1.0.0
 */

#ifndef WARDEN_GUEST_INTERPRETER_HPP
#define WARDEN_GUEST_INTERPRETER_HPP

#include <memory>
#include <string>

namespace warden::guest {

/**
 * @brief Owns the embedded interpreter of the current process
 *
 * Starts an isolated interpreter (no site import, no user site, no
 * environment variables, no signal handlers) unless one is already
 * running, in which case the scope borrows it and finalizes nothing.
 */
class InterpreterScope {
public:
    InterpreterScope();
    ~InterpreterScope();

    InterpreterScope(const InterpreterScope&) = delete;
    InterpreterScope& operator=(const InterpreterScope&) = delete;

    /**
     * @brief Whether this scope started the interpreter
     */
    [[nodiscard]] bool ownsInterpreter() const noexcept;

    /**
     * @brief Version of the running interpreter, e.g. "3.11.4"
     */
    [[nodiscard]] static std::string pythonVersion();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

/**
 * @brief Keeps a live interpreter consistent across fork()
 *
 * Construct before forking. The child calls afterForkChild() before
 * touching the interpreter; the parent calls afterForkParent(), which the
 * destructor also does if the parent forgot. Without a live interpreter
 * every step is a no-op.
 */
class InterpreterForkGuard {
public:
    InterpreterForkGuard();
    ~InterpreterForkGuard();

    InterpreterForkGuard(const InterpreterForkGuard&) = delete;
    InterpreterForkGuard& operator=(const InterpreterForkGuard&) = delete;

    void afterForkChild() noexcept;
    void afterForkParent() noexcept;

private:
    bool active_{false};
    bool resolved_{false};
    int gilState_{0};
};

}  // namespace warden::guest

#endif  // WARDEN_GUEST_INTERPRETER_HPP
