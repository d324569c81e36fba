#pragma once

#include <string>
#include <string_view>

// Forward declare QuickJS handles
struct JSRuntime;
struct JSContext;

namespace astrogen {

// Compiles and evaluates generated JavaScript with an embedded QuickJS engine
class JsChecker {
public:
    JsChecker();
    ~JsChecker();

    JsChecker(const JsChecker&) = delete;
    JsChecker& operator=(const JsChecker&) = delete;
    JsChecker(JsChecker&&) = delete;
    JsChecker& operator=(JsChecker&&) = delete;

    // Parse code as an ES module without linking or running it.
    // Throws std::runtime_error describing the first syntax error.
    void compile_module(std::string_view code, std::string_view filename);

    // Run code as a classic script and return its completion value as a string
    [[nodiscard]] std::string evaluate(std::string_view code);

private:
    [[nodiscard]] std::string take_exception();

    ::JSRuntime* rt_ = nullptr;
    ::JSContext* ctx_ = nullptr;
};

}  // namespace astrogen
