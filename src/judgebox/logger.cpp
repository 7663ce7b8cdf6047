#include "judgebox/logger.h"

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ansicolor_sink.h>

namespace {

using ansicolor_sink = spdlog::sinks::ansicolor_sink<spdlog::details::console_mutex>;

template <class Func>
void ForEachConsoleSink(Func&& func) {
  for (auto& i : spdlog::default_logger()->sinks()) {
    if (auto ptr = dynamic_cast<ansicolor_sink*>(i.get())) func(ptr->mutex_);
  }
}

void Prepare() {
  ForEachConsoleSink([](auto& mtx) { mtx.lock(); });
}

void Release() {
  ForEachConsoleSink([](auto& mtx) { mtx.unlock(); });
}

} // namespace

void InitLogger() {
  spdlog::set_pattern("[%t] %+");
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Release, Release);
}

void SetVerbosity(int verbosity) {
  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
}
