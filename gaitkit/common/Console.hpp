/*
 * Copyright (c) 2011-2019, The DART development contributors
 * All rights reserved.
 *
 * The list of contributors can be found at:
 *   https://github.com/dartsim/dart/blob/master/LICENSE
 *
 * This file is provided under the following "BSD-style" License:
 *   Redistribution and use in source and binary forms, with or
 *   without modification, are permitted provided that the following
 *   conditions are met:
 *   * Redistributions of source code must retain the above copyright
 *     notice, this list of conditions and the following disclaimer.
 *   * Redistributions in binary form must reproduce the above
 *     copyright notice, this list of conditions and the following
 *     disclaimer in the documentation and/or other materials provided
 *     with the distribution.
 *   THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND
 *   CONTRIBUTORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES,
 *   INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF
 *   MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 *   DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR
 *   CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
 *   SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
 *   LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF
 *   USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED
 *   AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT
 *   LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN
 *   ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 *   POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef GAITKIT_COMMON_CONSOLE_HPP_
#define GAITKIT_COMMON_CONSOLE_HPP_

#include <ostream>
#include <string>

/// \brief Output a message
#define gkmsg (::gaitkit::common::colorMsg("Msg", 32))

/// \brief Output a diagnostic message. Compiled out of release builds.
#ifndef NDEBUG
#define gkdbg (::gaitkit::common::colorMsg("Dbg", 36))
#else
#define gkdbg                                                                  \
  if (false)                                                                   \
  (::gaitkit::common::colorMsg("Dbg", 36))
#endif

/// \brief Output a warning message
#define gkwarn (::gaitkit::common::colorErr("Warning", __FILE__, __LINE__, 33))

/// \brief Output an error message
#define gkerr (::gaitkit::common::colorErr("Error", __FILE__, __LINE__, 31))

namespace gaitkit {
namespace common {

/// \brief Print a colored tag to stdout and return the stream
std::ostream& colorMsg(const std::string& _msg, int _color);

/// \brief Print a colored tag with the source location to stderr and return
/// the stream
std::ostream& colorErr(
    const std::string& _msg,
    const std::string& _file,
    unsigned int _line,
    int _color);

} // namespace common
} // namespace gaitkit

#endif // GAITKIT_COMMON_CONSOLE_HPP_
