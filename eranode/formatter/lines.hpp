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

#ifndef ERANODE_FORMATTER_LINES_HPP_
#define ERANODE_FORMATTER_LINES_HPP_

#include <string>
#include <vector>

namespace eranode {

typedef std::vector<std::string> Lines;

//! Emit each line as one Info record.
void print_lines(const Lines& lines);

} // namespace eranode

#endif  // ERANODE_FORMATTER_LINES_HPP_
