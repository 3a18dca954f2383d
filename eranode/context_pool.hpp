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

#ifndef ERANODE_CONTEXT_POOL_HPP_
#define ERANODE_CONTEXT_POOL_HPP_

#include <atomic>
#include <cstddef>
#include <iostream>
#include <memory>
#include <vector>

#include <boost/asio/detail/thread_group.hpp>
#include <boost/asio/execution.hpp>
#include <boost/asio/io_context.hpp>

namespace eranode {

//! Asynchronous scheduler running an execution loop on one thread.
class Context {
  public:
    Context();

    boost::asio::io_context* io_context() const noexcept { return io_context_.get(); }

    //! Execute the scheduler loop until stopped.
    void execution_loop();

    //! Stop the execution loop.
    void stop();

  private:
    //! The asynchronous event loop scheduler.
    std::shared_ptr<boost::asio::io_context> io_context_;

    //! The work-tracking executor that keep the scheduler running.
    boost::asio::execution::any_executor<> work_;
};

std::ostream& operator<<(std::ostream& out, const Context& c);

class ContextPool {
  public:
    explicit ContextPool(std::size_t pool_size);
    ~ContextPool();

    ContextPool(const ContextPool&) = delete;
    ContextPool& operator=(const ContextPool&) = delete;

    void start();

    void join();

    void stop();

    void run();

    std::size_t size() const noexcept { return contexts_.size(); }

    Context& next_context();

    boost::asio::io_context& next_io_context();

  private:
    // The pool of contexts
    std::vector<Context> contexts_;

    //! The pool of threads running the execution contexts.
    boost::asio::detail::thread_group context_threads_;

    // The next index to use for a context
    std::size_t next_index_;

    //! Flag indicating if pool has been stopped.
    std::atomic_bool stopped_{false};
};

} // namespace eranode

#endif // ERANODE_CONTEXT_POOL_HPP_
