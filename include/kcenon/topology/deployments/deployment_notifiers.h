// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#pragma once

/**
 * @file deployment_notifiers.h
 * @brief Deployment notification channels
 *
 * Notifiers deliver a deployment status change to one channel. Each call
 * receives the time budget of the send; a notifier must give up and fail
 * once the budget is exhausted.
 */

#include <chrono>
#include <cstdio>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <unordered_map>

#include "deployment_status.h"
#include "../config/project.h"
#include "../core/logging.h"
#include "../core/result_types.h"

namespace kcenon::topology {

/**
 * @class deployment_notifier
 * @brief Abstract notification channel
 */
class deployment_notifier {
public:
    virtual ~deployment_notifier() = default;

    /**
     * @brief Channel name, used as the key of per-channel notification state
     */
    virtual std::string name() const = 0;

    virtual bool is_ready() const = 0;

    virtual result_void notify(const project& p,
                               const deployment_status& status,
                               std::chrono::milliseconds timeout) = 0;
};

/**
 * @class deployment_formatter
 * @brief Formats a deployment status into a notification payload
 */
class deployment_formatter {
public:
    virtual ~deployment_formatter() = default;

    virtual std::string format(const project& p, const deployment_status& status) const = 0;
};

/**
 * @class json_deployment_formatter
 * @brief Formats deployment statuses as JSON
 */
class json_deployment_formatter : public deployment_formatter {
public:
    std::string format(const project& p, const deployment_status& status) const override {
        const auto& d = status.deployment;
        std::ostringstream oss;
        oss << "{";
        oss << "\"project\":\"" << escape_json(p.name.empty() ? p.id : p.name) << "\",";
        oss << "\"application\":\"" << escape_json(d.application.to_string()) << "\",";
        oss << "\"deployment\":\"" << escape_json(d.name) << "\",";
        oss << "\"state\":\"" << to_string(status.state) << "\",";
        oss << "\"started_at\":" << to_unix(d.started_at) << ",";
        if (d.finished()) {
            oss << "\"finished_at\":" << to_unix(d.finished_at) << ",";
        } else {
            oss << "\"finished_at\":null,";
        }
        oss << "\"images\":[";
        if (d.details) {
            bool first = true;
            for (const auto& image : d.details->container_images) {
                if (!first) oss << ",";
                oss << "\"" << escape_json(image) << "\"";
                first = false;
            }
        }
        oss << "]";
        if (d.snapshot) {
            const auto& s = *d.snapshot;
            oss << ",\"summary\":{";
            oss << "\"requests\":" << s.requests << ",";
            oss << "\"errors\":" << s.errors << ",";
            oss << "\"cpu_usage\":" << s.cpu_usage << ",";
            oss << "\"memory_leak\":" << s.memory_leak << ",";
            oss << "\"restarts\":" << s.restarts << ",";
            oss << "\"oom_kills\":" << s.oom_kills << ",";
            oss << "\"log_errors\":" << s.log_errors << ",";
            oss << "\"log_warnings\":" << s.log_warnings << ",";
            oss << "\"latency\":{";
            bool first = true;
            for (const auto& [le, count] : s.latency) {
                if (!first) oss << ",";
                oss << "\"" << le << "\":" << count;
                first = false;
            }
            oss << "}}";
        }
        oss << "}";
        return oss.str();
    }

private:
    static std::string escape_json(const std::string& s) {
        std::ostringstream oss;
        for (char c : s) {
            switch (c) {
                case '"':  oss << "\\\""; break;
                case '\\': oss << "\\\\"; break;
                case '\n': oss << "\\n";  break;
                case '\r': oss << "\\r";  break;
                case '\t': oss << "\\t";  break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                        oss << buf;
                    } else {
                        oss << c;
                    }
                    break;
            }
        }
        return oss.str();
    }
};

/**
 * @class text_deployment_formatter
 * @brief Formats deployment statuses as a single human-readable line
 */
class text_deployment_formatter : public deployment_formatter {
public:
    std::string format(const project& p, const deployment_status& status) const override {
        const auto& d = status.deployment;
        std::ostringstream oss;
        oss << "[" << (p.name.empty() ? p.id : p.name) << "] " << d.application.to_string()
            << " deployment " << d.name << " is " << to_string(status.state);
        if (d.details && !d.details->container_images.empty()) {
            oss << " (";
            bool first = true;
            for (const auto& image : d.details->container_images) {
                if (!first) oss << ", ";
                oss << image;
                first = false;
            }
            oss << ")";
        }
        return oss.str();
    }
};

/**
 * @struct webhook_config
 * @brief Configuration for the webhook deployment notifier
 */
struct webhook_config {
    std::string channel = "webhook";                        ///< Channel name
    std::string url;                                        ///< Webhook URL
    std::string method = "POST";                            ///< HTTP method
    std::unordered_map<std::string, std::string> headers;   ///< Custom headers
    std::string content_type = "application/json";          ///< Content type header

    webhook_config& add_header(const std::string& key, const std::string& value) {
        headers[key] = value;
        return *this;
    }

    bool validate() const {
        return !url.empty() && !channel.empty();
    }
};

/**
 * @class webhook_deployment_notifier
 * @brief Posts deployment statuses to a webhook endpoint
 *
 * The HTTP transport is injected with set_http_sender() and receives the
 * send timeout.
 *
 * @code
 * webhook_config config;
 * config.url = "https://hooks.example.com/deployments";
 *
 * auto notifier = std::make_shared<webhook_deployment_notifier>(config);
 * notifier->set_http_sender([&client](const auto& url, const auto& method,
 *                                     const auto& headers, const auto& body,
 *                                     std::chrono::milliseconds timeout) {
 *     return client.request(url, method, headers, body, timeout);
 * });
 * @endcode
 */
class webhook_deployment_notifier : public deployment_notifier {
public:
    using http_sender_func = std::function<common::VoidResult(
        const std::string& url,
        const std::string& method,
        const std::unordered_map<std::string, std::string>& headers,
        const std::string& body,
        std::chrono::milliseconds timeout
    )>;

    explicit webhook_deployment_notifier(const webhook_config& config,
                                         std::shared_ptr<deployment_formatter> formatter = nullptr)
        : config_(config)
        , formatter_(formatter ? formatter : std::make_shared<json_deployment_formatter>()) {}

    std::string name() const override {
        return config_.channel;
    }

    bool is_ready() const override {
        return config_.validate() && http_sender_ != nullptr;
    }

    result_void notify(const project& p,
                       const deployment_status& status,
                       std::chrono::milliseconds timeout) override {
        if (!http_sender_) {
            return make_void_error(topology_error_code::notifier_not_ready, "No HTTP sender configured");
        }
        auto headers = config_.headers;
        headers["Content-Type"] = config_.content_type;
        return http_sender_(config_.url, config_.method, headers, formatter_->format(p, status), timeout);
    }

    void set_http_sender(http_sender_func sender) {
        http_sender_ = std::move(sender);
    }

    const webhook_config& config() const { return config_; }

private:
    webhook_config config_;
    std::shared_ptr<deployment_formatter> formatter_;
    http_sender_func http_sender_;
};

/**
 * @class log_deployment_notifier
 * @brief Writes deployment statuses to a logger at info level
 */
class log_deployment_notifier : public deployment_notifier {
public:
    explicit log_deployment_notifier(logger_ptr logger,
                                     std::string channel = "log",
                                     std::shared_ptr<deployment_formatter> formatter = nullptr)
        : logger_(std::move(logger))
        , channel_(std::move(channel))
        , formatter_(formatter ? formatter : std::make_shared<text_deployment_formatter>()) {}

    std::string name() const override { return channel_; }

    bool is_ready() const override { return logger_ != nullptr; }

    result_void notify(const project& p,
                       const deployment_status& status,
                       std::chrono::milliseconds) override {
        if (!logger_) {
            return make_void_error(topology_error_code::notifier_not_ready, "No logger configured");
        }
        return logger_->log(log_level::info, formatter_->format(p, status));
    }

private:
    logger_ptr logger_;
    std::string channel_;
    std::shared_ptr<deployment_formatter> formatter_;
};

} // namespace kcenon::topology
