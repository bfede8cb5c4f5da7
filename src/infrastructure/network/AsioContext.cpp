#include "infrastructure/network/AsioContext.hpp"

#include <spdlog/spdlog.h>

namespace vlanvision::infra {

AsioContext::AsioContext(std::string name, size_t threadCount)
    : name_(std::move(name)), threadCount_(threadCount > 0 ? threadCount : 1) {
    spdlog::debug("AsioContext '{}' created with {} threads", name_, threadCount_);
}

AsioContext::~AsioContext() {
    stop();
}

void AsioContext::start() {
    if (running_.exchange(true)) {
        return;
    }

    if (ioContext_.stopped()) {
        ioContext_.restart();
    }
    workGuard_.emplace(asio::make_work_guard(ioContext_));

    threads_.reserve(threadCount_);
    for (size_t i = 0; i < threadCount_; ++i) {
        threads_.emplace_back([this, i]() {
            spdlog::trace("{} worker thread {} started", name_, i);
            ioContext_.run();
            spdlog::trace("{} worker thread {} stopped", name_, i);
        });
    }

    spdlog::info("AsioContext '{}' started with {} worker threads", name_, threadCount_);
}

void AsioContext::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    workGuard_.reset();
    ioContext_.stop();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();

    ioContext_.restart();
    spdlog::info("AsioContext '{}' stopped", name_);
}

} // namespace vlanvision::infra
