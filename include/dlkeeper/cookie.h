/*
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <string>
#include <ctime>
#include <mutex>
#include <vector>
#include <unordered_map>

namespace dlkeeper {

class Cookie {
public:
    // expiry == 0 marks a session cookie
    Cookie(std::string name, std::string value, std::string domain, std::string path,
           bool secure, time_t expiry);

    const std::string& name() const { return name_; }
    const std::string& value() const { return value_; }
    const std::string& domain() const { return domain_; }
    const std::string& path() const { return path_; }
    bool is_secure() const { return secure_; }
    time_t expiry() const { return expiry_; }

    bool is_expired(time_t now) const;

    // Domain suffix, path prefix, scheme and expiry checks
    bool matches(const std::string& host, const std::string& request_path, bool secure_request,
                 time_t now) const;

    // "name=value"
    std::string to_string() const;

private:
    std::string name_;
    std::string value_;
    std::string domain_;
    std::string path_;
    bool secure_;
    time_t expiry_;
};

// Cookies shared between the browser session and the HTTP session, so that
// resumed requests carry the same credentials as the original download.
// Thread-safe.
class CookieJar {
public:
    CookieJar() = default;

    // Add, or replace the cookie with the same name, domain and path
    void add_cookie(const Cookie& cookie);
    void remove_cookie(const std::string& name, const std::string& domain, const std::string& path);

    // "k=v; k2=v2" as typed on the command line; session cookies for domain
    void add_from_cookie_string(const std::string& cookie_string, const std::string& domain);

    // Netscape cookies.txt; returns the number of cookies loaded, -1 if
    // the file cannot be read
    int load_netscape_file(const std::string& path);

    // Value for the Cookie request header, empty if nothing matches
    std::string cookie_header_for(const std::string& url) const;

    void cleanup_expired();
    size_t size() const;

private:
    // Storage: domain -> cookies
    std::unordered_map<std::string, std::vector<Cookie>> cookies_;
    mutable std::mutex mutex_;
};

// Host part of a URL, lowercase, without port or credentials
std::string url_host(const std::string& url);

} // namespace dlkeeper
