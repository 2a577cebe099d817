#pragma once

#include <version>

// Version information
#define MICROGRAD_VERSION_MAJOR 0
#define MICROGRAD_VERSION_MINOR 1
#define MICROGRAD_VERSION_PATCH 0
#define MICROGRAD_VERSION_STRING "0.1.0"

// Function attributes
#define MICROGRAD_NODISCARD [[nodiscard]]
#define MICROGRAD_MAYBE_UNUSED [[maybe_unused]]

// Platform detection
#if defined(_WIN32) || defined(_WIN64)
#define MICROGRAD_PLATFORM_WINDOWS
#define MICROGRAD_PLATFORM_NAME "Windows"
#elif defined(__linux__)
#define MICROGRAD_PLATFORM_LINUX
#define MICROGRAD_PLATFORM_NAME "Linux"
#elif defined(__APPLE__)
#define MICROGRAD_PLATFORM_MACOS
#define MICROGRAD_PLATFORM_NAME "macOS"
#else
#error "Unsupported platform"
#endif

// Compiler detection
#if defined(_MSC_VER)
#define MICROGRAD_COMPILER_MSVC
#define MICROGRAD_COMPILER_NAME "MSVC"
#elif defined(__clang__)
#define MICROGRAD_COMPILER_CLANG
#define MICROGRAD_COMPILER_NAME "Clang"
#elif defined(__GNUC__)
#define MICROGRAD_COMPILER_GCC
#define MICROGRAD_COMPILER_NAME "GCC"
#endif

// Build configuration
#if defined(MICROGRAD_DEBUG) || defined(_DEBUG)
#define MICROGRAD_CONFIG_DEBUG
#define MICROGRAD_CONFIG_NAME "Debug"
#else
#define MICROGRAD_CONFIG_RELEASE
#define MICROGRAD_CONFIG_NAME "Release"
#endif

// Concurrency policy selected for micrograd::Value
#if defined(MICROGRAD_THREAD_SAFE)
#define MICROGRAD_POLICY_NAME "MultiThreaded"
#else
#define MICROGRAD_POLICY_NAME "SingleThreaded"
#endif

#define MICROGRAD_CACHE_LINE_SIZE 64
#define MICROGRAD_ALIGN_CACHE alignas(MICROGRAD_CACHE_LINE_SIZE)

// Branch prediction hints
#if defined(MICROGRAD_COMPILER_GCC) || defined(MICROGRAD_COMPILER_CLANG)
#define MICROGRAD_EXPECT(expr, value) __builtin_expect(!!(expr), (value))
#define MICROGRAD_PREDICT_FALSE(expr) MICROGRAD_EXPECT(!!(expr), 0)
#else
#define MICROGRAD_EXPECT(expr, value) (expr)
#define MICROGRAD_PREDICT_FALSE(expr) (expr)
#endif

// Class utilities
#define MICROGRAD_IMMOVABLE(Class) \
    Class(Class&&) = delete;       \
    Class& operator=(Class&&) = delete

#define MICROGRAD_UNCOPYABLE(Class) \
    Class(const Class&) = delete;   \
    Class& operator=(const Class&) = delete

// API visibility with platform-specific attributes
#if defined(MICROGRAD_PLATFORM_WINDOWS)
#define MICROGRAD_API_EXPORT __declspec(dllexport)
#define MICROGRAD_API_IMPORT __declspec(dllimport)
#else
#define MICROGRAD_API_EXPORT [[gnu::visibility("default")]]
#define MICROGRAD_API_IMPORT [[gnu::visibility("default")]]
#endif

#if defined(MICROGRAD_BUILD_SHARED)
#define MICROGRAD_API MICROGRAD_API_EXPORT
#else
#define MICROGRAD_API MICROGRAD_API_IMPORT
#endif
