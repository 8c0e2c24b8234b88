#pragma once

// Platform-specific API export macros
#ifdef _WIN32
#ifdef SPC_EXPORTS
#define SPC_API __declspec(dllexport)
#else
#define SPC_API __declspec(dllimport)
#endif
#else
#ifdef SPC_EXPORTS
#define SPC_API __attribute__((visibility("default")))
#else
#define SPC_API
#endif
#endif

namespace SPC {

/**
 * @brief Empty payload for operations that only report completion
 */
struct Unit {
    bool operator==(const Unit &) const = default;
};

}  // namespace SPC
