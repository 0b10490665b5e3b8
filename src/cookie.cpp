/*
 * src/cookie.cpp - Cookie jar shared by the browser and HTTP sessions
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "dlkeeper/cookie.h"
#include "dlkeeper/log.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace dlkeeper {

namespace {

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

// Path component of a URL, "/" when absent
std::string url_path(const std::string& url) {
    size_t start = url.find("://");
    start = start == std::string::npos ? 0 : start + 3;

    size_t slash = url.find('/', start);
    if (slash == std::string::npos) return "/";

    size_t end = url.find_first_of("?#", slash);
    return url.substr(slash, end == std::string::npos ? std::string::npos : end - slash);
}

} // namespace

// --- Cookie ---

Cookie::Cookie(std::string name, std::string value, std::string domain, std::string path,
               bool secure, time_t expiry)
    : name_(std::move(name)), value_(std::move(value)), domain_(to_lower(std::move(domain))),
      path_(path.empty() ? "/" : std::move(path)), secure_(secure), expiry_(expiry) {
}

bool Cookie::is_expired(time_t now) const {
    return expiry_ != 0 && now > expiry_;
}

bool Cookie::matches(const std::string& host, const std::string& request_path,
                     bool secure_request, time_t now) const {
    if (is_expired(now)) return false;
    if (secure_ && !secure_request) return false;
    if (request_path.compare(0, path_.size(), path_) != 0) return false;

    // ".example.com" and "example.com" both cover www.example.com
    std::string domain = !domain_.empty() && domain_[0] == '.' ? domain_.substr(1) : domain_;
    if (host == domain) return true;

    if (domain.length() < host.length()) {
        size_t diff = host.length() - domain.length();
        return host.compare(diff, domain.length(), domain) == 0 && host[diff - 1] == '.';
    }
    return false;
}

std::string Cookie::to_string() const {
    return name_ + "=" + value_;
}

// --- CookieJar ---

void CookieJar::add_cookie(const Cookie& cookie) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& list = cookies_[cookie.domain()];
    auto it = std::find_if(list.begin(), list.end(), [&](const Cookie& c) {
        return c.name() == cookie.name() && c.path() == cookie.path();
    });

    if (it != list.end()) {
        *it = cookie;
    } else {
        list.push_back(cookie);
    }
}

void CookieJar::remove_cookie(const std::string& name, const std::string& domain,
                              const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto found = cookies_.find(to_lower(domain));
    if (found == cookies_.end()) return;

    std::string cookie_path = path.empty() ? "/" : path;
    auto& list = found->second;
    list.erase(std::remove_if(list.begin(), list.end(), [&](const Cookie& c) {
        return c.name() == name && c.path() == cookie_path;
    }), list.end());

    if (list.empty()) {
        cookies_.erase(found);
    }
}

void CookieJar::add_from_cookie_string(const std::string& cookie_string, const std::string& domain) {
    std::stringstream ss(cookie_string);
    std::string segment;

    while (std::getline(ss, segment, ';')) {
        segment = trim(segment);
        size_t eq_pos = segment.find('=');
        if (eq_pos == std::string::npos || eq_pos == 0) continue;

        add_cookie(Cookie(trim(segment.substr(0, eq_pos)), trim(segment.substr(eq_pos + 1)),
                          domain, "/", false, 0));
    }
}

int CookieJar::load_netscape_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        log_error("Cannot open cookie file: " + path);
        return -1;
    }

    const std::string http_only_prefix = "#HttpOnly_";
    int loaded = 0;
    std::string line;

    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();

        if (line.compare(0, http_only_prefix.size(), http_only_prefix) == 0) {
            line.erase(0, http_only_prefix.size());
        } else if (line.empty() || line[0] == '#') {
            continue;
        }

        // domain, include-subdomains, path, secure, expiry, name, value
        std::vector<std::string> fields;
        std::stringstream ss(line);
        std::string field;
        while (std::getline(ss, field, '\t')) {
            fields.push_back(field);
        }
        if (fields.size() < 7) {
            log_debug("Skipping malformed cookie line: " + line);
            continue;
        }

        time_t expiry = 0;
        try {
            expiry = static_cast<time_t>(std::stoll(fields[4]));
        } catch (const std::exception&) {
            log_debug("Bad cookie expiry: " + fields[4]);
            continue;
        }

        add_cookie(Cookie(fields[5], fields[6], fields[0], fields[2],
                          to_lower(fields[3]) == "true", expiry));
        loaded++;
    }

    log_info("Loaded " + std::to_string(loaded) + " cookies from " + path);
    return loaded;
}

std::string CookieJar::cookie_header_for(const std::string& url) const {
    std::string host = url_host(url);
    std::string path = url_path(url);
    bool secure = to_lower(url.substr(0, 8)) == "https://";
    time_t now = std::time(nullptr);

    std::lock_guard<std::mutex> lock(mutex_);
    std::string header;

    for (const auto& pair : cookies_) {
        for (const auto& cookie : pair.second) {
            if (cookie.matches(host, path, secure, now)) {
                if (!header.empty()) header += "; ";
                header += cookie.to_string();
            }
        }
    }

    return header;
}

void CookieJar::cleanup_expired() {
    std::lock_guard<std::mutex> lock(mutex_);
    time_t now = std::time(nullptr);
    size_t removed_count = 0;

    for (auto it = cookies_.begin(); it != cookies_.end();) {
        auto& list = it->second;
        size_t original_size = list.size();

        list.erase(std::remove_if(list.begin(), list.end(), [&](const Cookie& c) {
            return c.is_expired(now);
        }), list.end());

        removed_count += original_size - list.size();

        if (list.empty()) {
            it = cookies_.erase(it);
        } else {
            ++it;
        }
    }

    if (removed_count > 0) {
        log_debug("Dropped " + std::to_string(removed_count) + " expired cookies");
    }
}

size_t CookieJar::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& pair : cookies_) {
        count += pair.second.size();
    }
    return count;
}

std::string url_host(const std::string& url) {
    size_t start = url.find("://");
    start = start == std::string::npos ? 0 : start + 3;

    size_t end = url.find_first_of("/?#", start);
    if (end == std::string::npos) end = url.length();

    std::string authority = url.substr(start, end - start);
    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        authority.erase(0, at + 1);
    }

    size_t port_pos = authority.rfind(':');
    if (port_pos != std::string::npos && authority.find(']') == std::string::npos) {
        authority.erase(port_pos);
    }

    return to_lower(authority);
}

} // namespace dlkeeper
