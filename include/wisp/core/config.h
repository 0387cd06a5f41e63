#ifndef WISP_CORE_CONFIG_H
#define WISP_CORE_CONFIG_H

#include <cstdint>

namespace wisp::core::config {

inline constexpr std::uint32_t kDefaultViewportWidth = 800;
inline constexpr std::uint32_t kDefaultViewportHeight = 600;

// Tag of the element synthesized when a document has no single root element.
inline constexpr const char kImplicitRootTag[] = "html";

inline constexpr float kDefaultFontSizePx = 16.0f;

}  // namespace wisp::core::config

#endif  // WISP_CORE_CONFIG_H
