#include "common/net_utils.hpp"
#include <curl/curl.h>
#include <fstream>
#include <memory>
#include "common/exceptions.hpp"

namespace hjudge::net {
using namespace std;

static size_t write_to_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
    static_cast<string *>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

static size_t write_to_stream(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto &out = *static_cast<ofstream *>(userdata);
    out.write(ptr, size * nmemb);
    return out ? size * nmemb : 0;
}

using curl_ptr = unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using slist_ptr = unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

static curl_ptr make_curl() {
    curl_ptr curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) BOOST_THROW_EXCEPTION(network_error("unable to initialize curl"));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    return curl;
}

http_response request(const http_request &req) {
    auto curl = make_curl();
    http_response resp;
    slist_ptr headers(nullptr, curl_slist_free_all);

    curl_easy_setopt(curl.get(), CURLOPT_URL, req.url.c_str());
    if (!req.unix_socket.empty())
        curl_easy_setopt(curl.get(), CURLOPT_UNIX_SOCKET_PATH, req.unix_socket.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, req.method.c_str());
    if (req.method == "POST" || !req.body.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, req.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(req.body.size()));
    }
    if (!req.content_type.empty()) {
        headers.reset(curl_slist_append(headers.release(), ("Content-Type: " + req.content_type).c_str()));
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(req.timeout * 1000));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &resp.body);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK)
        BOOST_THROW_EXCEPTION(network_error() << "unable to " << req.method << " " << req.url << ", error=" << curl_easy_strerror(res));

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status_code);
    return resp;
}

string encode_form(const map<string, string> &fields) {
    auto curl = make_curl();
    string body;
    for (auto &[key, value] : fields) {
        unique_ptr<char, decltype(&curl_free)> k(curl_easy_escape(curl.get(), key.c_str(), key.size()), curl_free);
        unique_ptr<char, decltype(&curl_free)> v(curl_easy_escape(curl.get(), value.c_str(), value.size()), curl_free);
        if (!k || !v) BOOST_THROW_EXCEPTION(network_error() << "unable to encode form field " << key);
        if (!body.empty()) body += '&';
        body += k.get();
        body += '=';
        body += v.get();
    }
    return body;
}

http_response post_form(const string &url, const map<string, string> &fields, double timeout) {
    http_request req;
    req.method = "POST";
    req.url = url;
    req.body = encode_form(fields);
    req.content_type = "application/x-www-form-urlencoded";
    req.timeout = timeout;
    return request(req);
}

void download_file(const string &url, const map<string, string> &fields, const filesystem::path &path, double timeout) {
    if (path.has_parent_path())
        filesystem::create_directories(path.parent_path());
    auto curl = make_curl();
    string body = encode_form(fields);
    ofstream destination(path, ios::binary | ios::trunc);
    if (!destination)
        BOOST_THROW_EXCEPTION(network_error() << "unable to open " << path.string() << " for writing");

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout * 1000));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_stream);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &destination);

    CURLcode res = curl_easy_perform(curl.get());
    long status_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status_code);
    destination.close();

    if (res != CURLE_OK) {
        filesystem::remove(path);
        BOOST_THROW_EXCEPTION(network_error() << "unable to download file from " << url << ", error=" << curl_easy_strerror(res));
    }
    if (status_code >= 300) {
        filesystem::remove(path);
        BOOST_THROW_EXCEPTION(network_error() << "unable to download file from " << url << ", status code=" << status_code);
    }
}

}  // namespace hjudge::net
