#pragma once

#ifndef TF_BUILD_VERSION
#define TF_BUILD_VERSION "0.0.0-dev"
#endif

namespace tf::version
{

inline constexpr char const kSemanticVersion[] = TF_BUILD_VERSION;
inline constexpr char const kDisplayVersion[] = "TinyFetch " TF_BUILD_VERSION;

} // namespace tf::version
