#include "web/curl_fetch.h"
#include "utils/logger.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

namespace zackathon {
namespace web {

namespace {

std::string quoteArg(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += '\'';
    return out;
}

std::string readStderrCapture(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return {};
    std::string out(16 * 1024, '\0');
    in.read(&out[0], static_cast<std::streamsize>(out.size()));
    out.resize(static_cast<size_t>(in.gcount()));
    while (!out.empty() && (out.back() == '\n' || out.back() == '\r')) out.pop_back();
    return out;
}

int exitStatus(int rc) {
    if (rc == -1) return -1;
    if (WIFEXITED(rc)) return WEXITSTATUS(rc);
    if (WIFSIGNALED(rc)) return 128 + WTERMSIG(rc);
    return rc;
}

// Only http(s) URLs reach the shell.
bool acceptableUrl(const std::string& url) {
    return url.rfind("https://", 0) == 0 || url.rfind("http://", 0) == 0;
}

}

CurlFetchResult curlFetch(const std::string& url, const CurlFetchOptions& options) {
    CurlFetchResult result;
    if (!acceptableUrl(url)) {
        result.error = "unsupported url scheme";
        return result;
    }

    std::string tmpl = "/tmp/zackathon_curl_XXXXXX";
    std::vector<char> pathBuf(tmpl.begin(), tmpl.end());
    pathBuf.push_back('\0');
    int fd = mkstemp(pathBuf.data());
    if (fd < 0) {
        result.error = "mkstemp failed";
        return result;
    }
    close(fd);
    std::string errPath(pathBuf.data());

    std::ostringstream cmd;
    cmd << "curl -sS ";
    if (options.followRedirects) cmd << "-L ";
    if (options.failOnHttpError) cmd << "-f ";
    cmd << "--max-time " << options.timeoutSeconds << " ";
    cmd << "--connect-timeout " << options.timeoutSeconds << " ";
    if (!options.userAgent.empty()) cmd << "-A " << quoteArg(options.userAgent) << " ";
    cmd << quoteArg(url) << " 2>" << quoteArg(errPath);

    LOG_DEBUG("curl " + url);
    FILE* fp = popen(cmd.str().c_str(), "r");
    if (!fp) {
        result.error = "popen failed";
        std::remove(errPath.c_str());
        return result;
    }

    char buf[4096];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), fp)) > 0) {
        size_t room = options.maxBytes - result.body.size();
        result.body.append(buf, n < room ? n : room);
        if (n >= room) {
            result.truncated = true;
            break;
        }
    }

    result.exitCode = exitStatus(pclose(fp));
    result.error = readStderrCapture(errPath);
    std::remove(errPath.c_str());
    return result;
}

}
}
