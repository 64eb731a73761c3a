#include "termoracle/session/env_probe.hpp"

#include <cstdio>
#include <cstdlib>

#include <sys/utsname.h>
#include <unistd.h>

namespace termoracle::session {
    namespace {
        struct CommandOutput {
            bool ok{false};
            std::string out{};
        };

        // Runs a shell command with stderr discarded.
        CommandOutput run_command(const std::string& cmd) {
            CommandOutput result{};
            const std::string full = cmd + " 2>/dev/null";
            FILE* pipe = ::popen(full.c_str(), "r");
            if (!pipe) {
                return result;
            }
            char buf[512];
            size_t n = 0;
            while ((n = std::fread(buf, 1, sizeof(buf), pipe)) > 0) {
                result.out.append(buf, n);
            }
            const int rc = ::pclose(pipe);
            result.ok = rc == 0;
            return result;
        }

        std::string trim(const std::string& s) {
            const char* ws = " \t\r\n";
            const size_t b = s.find_first_not_of(ws);
            if (b == std::string::npos) {
                return {};
            }
            const size_t e = s.find_last_not_of(ws);
            return s.substr(b, e - b + 1);
        }

        std::string first_line(const std::string& s) {
            const std::string t = trim(s);
            const size_t nl = t.find('\n');
            return trim(nl == std::string::npos ? t : t.substr(0, nl));
        }

        std::string env_string(const char* name) {
            const char* v = std::getenv(name);
            return v ? std::string(v) : std::string();
        }
    } // namespace

    std::string command_version(const char* tool) {
        const CommandOutput r = run_command(std::string(tool) + " --version");
        if (!r.ok) {
            return "unknown";
        }
        const std::string line = first_line(r.out);
        return line.empty() ? std::string("unknown") : line;
    }

    EnvSnapshot probe_environment() {
        EnvSnapshot snap{};

        char host[256] = {};
        if (::gethostname(host, sizeof(host) - 1) == 0 && host[0] != '\0') {
            snap.host = host;
        }

        struct utsname uts {};
        if (::uname(&uts) == 0) {
            snap.platform = std::string(uts.sysname) + " " + uts.machine;
            if (snap.host == "unknown" && uts.nodename[0] != '\0') {
                snap.host = uts.nodename;
            }
        }

        const CommandOutput sha = run_command("git rev-parse --short HEAD");
        if (sha.ok) {
            const std::string line = first_line(sha.out);
            if (!line.empty()) {
                snap.git_commit = line;
            }
        }

        const CommandOutput status = run_command("git status --porcelain");
        snap.git_dirty = status.ok && !trim(status.out).empty();

        snap.rustc = command_version("rustc");
        snap.cargo = command_version("cargo");

        snap.term = env_string("TERM");
        snap.colorterm = env_string("COLORTERM");
        snap.no_color = env_string("NO_COLOR");
        snap.locale = env_string("LANG");
        snap.timezone = env_string("TZ");
        return snap;
    }
} // namespace termoracle::session
