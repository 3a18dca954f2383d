/*
   Copyright 2023 The Eranode Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#include "context_pool.hpp"

#include <stdexcept>
#include <thread>
#include <utility>

#include <eranode/common/log.hpp>

namespace eranode {

std::ostream& operator<<(std::ostream& out, const Context& c) {
    out << "io_context: " << c.io_context();
    return out;
}

Context::Context()
    : io_context_{std::make_shared<boost::asio::io_context>()},
      work_{boost::asio::require(io_context_->get_executor(), boost::asio::execution::outstanding_work.tracked)} {}

void Context::execution_loop() {
    io_context_->run();
}

void Context::stop() {
    io_context_->stop();
}

ContextPool::ContextPool(std::size_t pool_size) : next_index_{0} {
    if (pool_size == 0) {
        throw std::logic_error("ContextPool::ContextPool pool_size is 0");
    }
    ERANODE_DEBUG << "ContextPool::ContextPool creating pool with size: " << pool_size << "\n";

    // Create as many execution contexts as required by the pool size
    for (std::size_t i{0}; i < pool_size; ++i) {
        contexts_.emplace_back();
        ERANODE_DEBUG << "ContextPool::ContextPool context[" << i << "] " << contexts_[i] << "\n";
    }
}

ContextPool::~ContextPool() {
    ERANODE_TRACE << "ContextPool::~ContextPool started " << this << "\n";
    stop();
    join();
    ERANODE_TRACE << "ContextPool::~ContextPool completed " << this << "\n";
}

void ContextPool::start() {
    ERANODE_TRACE << "ContextPool::start started\n";

    if (!stopped_) {
        // Create a pool of threads to run all of the contexts (each one having 1 thread)
        for (std::size_t i{0}; i < contexts_.size(); ++i) {
            auto& context = contexts_[i];
            context_threads_.create_thread([&, i = i]() {
                ERANODE_DEBUG << "thread start context[" << i << "] thread_id: " << std::this_thread::get_id() << "\n";
                context.execution_loop();
                ERANODE_DEBUG << "thread end context[" << i << "] thread_id: " << std::this_thread::get_id() << "\n";
            });
            ERANODE_DEBUG << "ContextPool::start context[" << i << "].io_context started: " << context.io_context() << "\n";
        }
    }

    ERANODE_TRACE << "ContextPool::start completed\n";
}

void ContextPool::join() {
    ERANODE_TRACE << "ContextPool::join started\n";

    // Wait for all threads in the pool to exit.
    ERANODE_DEBUG << "ContextPool::join joining...\n";
    context_threads_.join();

    ERANODE_TRACE << "ContextPool::join completed\n";
}

void ContextPool::stop() {
    // Explicitly stop all scheduler runnable components
    ERANODE_TRACE << "ContextPool::stop started\n";

    if (!stopped_) {
        for (std::size_t i{0}; i < contexts_.size(); ++i) {
            contexts_[i].stop();
            ERANODE_DEBUG << "ContextPool::stop context[" << i << "].io_context stopped: " << contexts_[i].io_context() << "\n";
        }
        stopped_ = true;
    }

    ERANODE_TRACE << "ContextPool::stop completed\n";
}

void ContextPool::run() {
    start();
    join();
}

Context& ContextPool::next_context() {
    // Use a round-robin scheme to choose the next context to use
    auto& context = contexts_[next_index_];
    next_index_ = (next_index_ + 1) % contexts_.size();
    return context;
}

boost::asio::io_context& ContextPool::next_io_context() {
    auto& context = next_context();
    return *context.io_context();
}

} // namespace eranode
