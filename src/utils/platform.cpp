#include "ollama/utils/platform.hpp"

#include <sstream>
#include <string>

namespace ollama::utils {
namespace {

#ifdef OLLAMA_CPP_VERSION
constexpr const char* kPackageVersion = OLLAMA_CPP_VERSION;
#else
constexpr const char* kPackageVersion = "0.0.0-dev";
#endif

std::string detect_os() {
#if defined(__APPLE__) && defined(__MACH__)
  return "MacOS";
#elif defined(__ANDROID__)
  return "Android";
#elif defined(_WIN32)
  return "Windows";
#elif defined(__linux__)
  return "Linux";
#elif defined(__FreeBSD__)
  return "FreeBSD";
#elif defined(__unix__)
  return "Unix";
#else
  return "Unknown";
#endif
}

std::string detect_arch() {
#if defined(__x86_64__) || defined(_M_X64)
  return "x64";
#elif defined(__i386__) || defined(_M_IX86)
  return "x32";
#elif defined(__aarch64__) || defined(_M_ARM64)
  return "arm64";
#elif defined(__arm__) || defined(_M_ARM)
  return "arm";
#else
  return "unknown";
#endif
}

std::string detect_compiler() {
  std::ostringstream oss;
#if defined(__clang__)
  oss << "clang/" << __clang_major__ << '.' << __clang_minor__ << '.' << __clang_patchlevel__;
#elif defined(_MSC_VER)
  oss << "msvc/" << (_MSC_VER / 100) << '.' << (_MSC_VER % 100);
#elif defined(__GNUC__)
  oss << "gcc/" << __GNUC__ << '.' << __GNUC_MINOR__ << '.' << __GNUC_PATCHLEVEL__;
#else
  oss << "unknown";
#endif
  return oss.str();
}

PlatformProperties compute_properties() {
  PlatformProperties props;
  props.package_version = kPackageVersion;
  props.os = detect_os();
  props.arch = detect_arch();
  props.compiler = detect_compiler();
  return props;
}

}  // namespace

const PlatformProperties& platform_properties() {
  static const PlatformProperties props = compute_properties();
  return props;
}

std::string user_agent() {
  const auto& props = platform_properties();
  return "ollama-cpp/" + props.package_version + " (" + props.arch + " " + props.os + ") " + props.compiler;
}

}  // namespace ollama::utils
