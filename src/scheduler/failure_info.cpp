#include "scheduler/failure_info.hpp"

#include <cstdlib>
#include <memory>
#include <typeinfo>

#include <cxxabi.h>
#include <fmt/core.h>

std::string demangle(const char* mangled) {
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> res{
        abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free};
    std::string name = (status == 0 && res) ? res.get() : mangled;

    // std::throw_with_nested 生成的包装类型，只保留被包装的类型名
    const std::string nestedPrefix = "std::_Nested_exception<";
    if (name.rfind(nestedPrefix, 0) == 0 && name.back() == '>') {
        name = name.substr(nestedPrefix.size(), name.size() - nestedPrefix.size() - 1);
    }
    return name;
}

namespace {

constexpr std::size_t kMaxNestedDepth = 16;

std::string currentExceptionTypeName() {
    const std::type_info* ti = abi::__cxa_current_exception_type();
    return ti ? demangle(ti->name()) : std::string("unknown exception");
}

void collectChain(std::exception_ptr ep, std::vector<std::string>& out) {
    if (!ep || out.size() >= kMaxNestedDepth) return;
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        out.push_back(fmt::format("{}: {}", demangle(typeid(e).name()), e.what()));
        try {
            std::rethrow_if_nested(e);
        } catch (...) {
            collectChain(std::current_exception(), out);
        }
    } catch (...) {
        out.push_back(fmt::format("{}: non-standard exception", currentExceptionTypeName()));
    }
}

} // namespace

FailureInfo captureFailure(std::exception_ptr ep, const std::string& context) {
    FailureInfo info;
    collectChain(ep, info.chain);
    if (info.chain.empty()) info.chain.emplace_back("unknown exception");

    info.error = info.chain.front();

    std::string tb = fmt::format("Traceback ({}):\n", context);
    for (std::size_t i = 0; i < info.chain.size(); ++i) {
        if (i > 0) tb += "Caused by:\n";
        tb += fmt::format("  {}\n", info.chain[i]);
    }
    info.traceback = std::move(tb);
    return info;
}
