#pragma once
#include <chrono>
#include <cstddef>

// Fixed limits of the job engine. Not runtime-configurable.
constexpr std::size_t kMaxPromptLength = 100000;
constexpr int kMinNumPredict = 1;
constexpr int kMaxNumPredict = 8192;
constexpr double kMinTemperature = 0.0;
constexpr double kMaxTemperature = 2.0;
constexpr std::chrono::milliseconds kDefaultTimeout{120000};
constexpr int kDefaultConcurrency = 3;
constexpr int kMaxConcurrency = 8;

// Grace period between SIGTERM and SIGKILL for a timed-out child.
constexpr std::chrono::milliseconds kKillGrace{5000};
