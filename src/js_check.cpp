#include "js_check.hpp"

#include <sstream>
#include <stdexcept>

extern "C" {
#include "quickjs.h"
}

namespace astrogen {

namespace {

// Generated modules are small; this only guards against runaway tests
constexpr size_t kMemoryLimit = 64 * 1024 * 1024;

}  // namespace

JsChecker::JsChecker() {
    rt_ = JS_NewRuntime();
    if (!rt_) {
        throw std::runtime_error("Failed to create QuickJS runtime");
    }
    JS_SetMemoryLimit(rt_, kMemoryLimit);

    ctx_ = JS_NewContext(rt_);
    if (!ctx_) {
        JS_FreeRuntime(rt_);
        throw std::runtime_error("Failed to create QuickJS context");
    }
}

JsChecker::~JsChecker() {
    if (ctx_) {
        JS_FreeContext(ctx_);
    }
    if (rt_) {
        JS_FreeRuntime(rt_);
    }
}

std::string JsChecker::take_exception() {
    JSValue exception = JS_GetException(ctx_);
    if (JS_IsNull(exception) || JS_IsUndefined(exception)) {
        return "Unknown error";
    }

    std::ostringstream oss;
    const char* exc_str = JS_ToCString(ctx_, exception);
    if (exc_str) {
        oss << exc_str;
        JS_FreeCString(ctx_, exc_str);
    }

    JSValue stack = JS_GetPropertyStr(ctx_, exception, "stack");
    if (!JS_IsUndefined(stack)) {
        const char* stack_str = JS_ToCString(ctx_, stack);
        if (stack_str) {
            oss << "\nStack: " << stack_str;
            JS_FreeCString(ctx_, stack_str);
        }
    }

    JS_FreeValue(ctx_, stack);
    JS_FreeValue(ctx_, exception);

    std::string message = oss.str();
    return message.empty() ? "Unknown error" : message;
}

void JsChecker::compile_module(std::string_view code, std::string_view filename) {
    // JS_Eval requires a NUL-terminated buffer
    std::string buffer(code);
    std::string name(filename);

    JSValue compiled = JS_Eval(ctx_, buffer.c_str(), buffer.size(), name.c_str(),
                             JS_EVAL_TYPE_MODULE | JS_EVAL_FLAG_COMPILE_ONLY);
    if (JS_IsException(compiled)) {
        throw std::runtime_error("Generated module " + name + " does not compile: " +
                                 take_exception());
    }
    // Compiled modules are owned by the context; JS_FreeValue must not see them
}

std::string JsChecker::evaluate(std::string_view code) {
    std::string buffer(code);

    JSValue result = JS_Eval(ctx_, buffer.c_str(), buffer.size(), "<evaluate>",
                             JS_EVAL_TYPE_GLOBAL);
    if (JS_IsException(result)) {
        throw std::runtime_error("Evaluation failed: " + take_exception());
    }

    std::string value;
    const char* str = JS_ToCString(ctx_, result);
    if (str) {
        value = str;
        JS_FreeCString(ctx_, str);
    }
    JS_FreeValue(ctx_, result);
    return value;
}

}  // namespace astrogen
