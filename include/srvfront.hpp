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
 * @file srvfront.hpp
 * @brief srvfront - TCP server front end
 *
 * Binds a listening socket, accepts connections on a poll() reactor,
 * applies connection limits and hands every admitted socket to a
 * user-defined Handler. Optionally pre-forks worker processes.
 *
 * Usage:
 *   #include "srvfront.hpp"
 *
 *   class Echo : public srvfront::Handler {
 *    public:
 *     using Handler::Handler;
 *     void handle() override { push("hello\r\n"); }
 *    protected:
 *     void on_data(std::string_view data) override { push(data); }
 *   };
 *
 *   int main() {
 *     srvfront::PollLoop loop;
 *     srvfront::Server server("", 2121, srvfront::handler_type<Echo>("echo"), loop);
 *     server.serve();
 *   }
 */

#ifndef SRVFRONT_HPP_
#define SRVFRONT_HPP_

#include "srvfront/admission.hpp"
#include "srvfront/event_loop.hpp"
#include "srvfront/handler.hpp"
#include "srvfront/log.hpp"
#include "srvfront/prefork.hpp"
#include "srvfront/server.hpp"
#include "srvfront/signals.hpp"
#include "srvfront/stats.hpp"
#include "srvfront/tls.hpp"
#include "srvfront/transport.hpp"
#include "srvfront/vocabulary.hpp"

#endif  // SRVFRONT_HPP_
