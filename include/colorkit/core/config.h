#ifndef COLORKIT_CORE_CONFIG_H
#define COLORKIT_CORE_CONFIG_H

#include <cstddef>

namespace colorkit::core::config {

// Membership slack on linear-light channels; absorbs matrix rounding only.
inline constexpr double kGamutEpsilon = 0.000075;

// Below this chroma the hue angle is meaningless and is reported as 0.
inline constexpr double kAchromaticThreshold = 0.0001;

inline constexpr double kMappingTolerance = 0.0001;
inline constexpr double kBoundaryTolerance = 0.0001;
inline constexpr double kBoundaryMaxIterations = 30;

// Soft chroma ceiling of the canonical color; also the percent scale for
// oklch()/oklab() chroma and a/b components.
inline constexpr double kMaxChroma = 0.4;
inline constexpr double kPercentChromaScale = 0.4;

inline constexpr int kDefaultBoundarySteps = 48;
inline constexpr int kDefaultRegionSteps = 64;
inline constexpr double kDefaultBandSelectedLightness = 0.5;

inline constexpr double kWcagAaThreshold = 4.5;
inline constexpr double kWcagAaaThreshold = 7.0;
inline constexpr double kWcagAaLargeThreshold = 3.0;
inline constexpr double kWcagAaaLargeThreshold = 4.5;

inline constexpr std::size_t kDefaultWorkerThreads = 2;

// Events a DiagnosticEmitter keeps before dropping the oldest.
inline constexpr std::size_t kDefaultMaxDiagnosticEvents = 1024;

}  // namespace colorkit::core::config

#endif  // COLORKIT_CORE_CONFIG_H
