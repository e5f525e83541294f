/*
 *     Copyright 2021 Couchbase, Inc.
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

/** Helpers to avoid needless warnings */
#pragma once
/* define a portable, warning-free nodiscard - DS_NODISCARD */
#if defined(__has_cpp_attribute)
#if __has_cpp_attribute(nodiscard)
#define DS_NODISCARD [[nodiscard]]
#elif __has_cpp_attribute(gnu::warn_unused_result)
#define DS_NODISCARD [[gnu::warn_unused_result]]
#else
#define DS_NODISCARD
#endif
#else
#define DS_NODISCARD
#endif
