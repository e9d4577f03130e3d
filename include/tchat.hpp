/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file tchat.hpp
 * @brief TCHAT - framed TCP chat server and client library
 *
 * Blocking, thread-per-connection chat server: length-prefixed framing,
 * a registry of named users, fan-out broadcast, a per-connection session
 * state machine and a handful of in-band commands.
 *
 * Usage:
 *   #include "tchat.hpp"
 *
 *   int main() {
 *     tchat::Server server(12000);
 *     server.run();
 *   }
 */

#ifndef TCHAT_HPP_
#define TCHAT_HPP_

#include "tchat/broadcaster.hpp"
#include "tchat/client.hpp"
#include "tchat/commands.hpp"
#include "tchat/config.hpp"
#include "tchat/connection.hpp"
#include "tchat/log.hpp"
#include "tchat/protocol.hpp"
#include "tchat/registry.hpp"
#include "tchat/server.hpp"
#include "tchat/session.hpp"
#include "tchat/stats.hpp"
#include "tchat/vocabulary.hpp"

#endif  // TCHAT_HPP_
