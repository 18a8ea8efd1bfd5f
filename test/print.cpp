// Copyright (C) 2025 Tycho Softworks.
// This code is licensed under MIT license.

#undef  NDEBUG
#include "compiler.hpp"     // IWYU pragma: keep
#include "print.hpp"
#include "ordered_map.hpp"

#include <string>
#include <sstream>
#include <vector>
#include <cstdlib>

namespace {
std::vector<std::string> captured;
system_logger logger;

struct opaque {
    int id{0};
};
} // end namespace

auto main([[maybe_unused]] int argc, [[maybe_unused]] char **argv) -> int {
    try {
        assert(omap::format("{}-{}", "a", 2) == "a-2");
        assert(inspect(std::string("key")) == "\"key\"");
        assert(inspect("literal") == "\"literal\"");
        assert(inspect(42) == "42");
        assert(inspect(false) == "false");
        assert(inspect(opaque{}) == "<unprintable>");

        std::ostringstream out;
        omap::print(out, "{}:", "size");
        omap::println(out, " {}", 2);
        assert(out.str() == "size: 2\n");

        logger.set(0, [](const std::string& msg, const char *type) {
            captured.push_back(std::string(type) + ":" + msg);
        });
        assert(logger.level() == 0);
        logger.info("loaded {} entries", 3);
        logger.warn("nothing to warn about");
        logger.debug(0, "trace {}", "visible");
        logger.debug(4, "trace {}", "filtered");
        assert(captured.size() == 3);
        assert(captured[0] == "info:loaded 3 entries");
        assert(captured[1] == "warn:nothing to warn about");
        assert(captured[2] == "debug:trace visible");

        // conflicts are reported to the application through its logger
        const auto flags = ordered_map<std::string, bool>().put("enabled", false);
        try {
            flags.put_if_absent_or_fail("enabled", true);
            ::exit(-1);
        }
        catch(const key_conflict& err) {
            logger.error("{}", err.what());
        }
        assert(captured.size() == 4);
        assert(captured[3] == "error:key \"enabled\" already exists in: ordered_map{\"enabled\": false}");

        // syslog delivery does not bypass the notify hook
        logger.open("test_print");
        logger.notice("opened {}", "syslog");
        logger.close();
        logger.notice("closed");
        assert(captured.size() == 6);
        assert(captured[4] == "notice:opened syslog");
        assert(captured[5] == "notice:closed");
    }
    catch(...) {
        ::exit(-1);
    }
}
