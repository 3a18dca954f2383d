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

#ifndef ERANODE_FORMATTER_TRANSACTION_RENDERER_HPP_
#define ERANODE_FORMATTER_TRANSACTION_RENDERER_HPP_

#include <boost/asio/awaitable.hpp>

#include <eranode/formatter/address_directory.hpp>
#include <eranode/formatter/lines.hpp>
#include <eranode/resolver/selector_resolver.hpp>
#include <eranode/types/show_options.hpp>
#include <eranode/types/transaction_trace.hpp>

namespace eranode {

struct RenderOptions {
    ShowCalls show_calls{ShowCalls::None};
    ShowStorageLogs show_storage_logs{ShowStorageLogs::None};
    ShowVmDetails show_vm_details{ShowVmDetails::None};
    bool resolve_hashes{false};
};

//! Full report of one executed transaction: VM results, storage logs, call traces and events.
boost::asio::awaitable<Lines> render_transaction(const TransactionTrace& trace, const RenderOptions& options,
    const AddressDirectory& directory, resolver::SelectorResolver& resolver);

} // namespace eranode

#endif  // ERANODE_FORMATTER_TRANSACTION_RENDERER_HPP_
