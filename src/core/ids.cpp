#include <berry_mcp/core/ids.hpp>

#include <cstdlib>
#include <memory>
#include <mutex>
#include <random>
#include <typeinfo>

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace berry_mcp {

std::string RandomHex(std::size_t length) {
    static constexpr char kDigits[] = "0123456789abcdef";
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};

    std::uniform_int_distribution<int> dist(0, 15);
    std::string out(length, '0');
    std::lock_guard<std::mutex> lock(mutex);
    for (auto& c : out) {
        c = kDigits[dist(engine)];
    }
    return out;
}

std::string ExceptionTypeName(const std::exception& e) {
    const char* raw = typeid(e).name();
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(raw, nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
#endif
    return raw;
}

} // namespace berry_mcp
