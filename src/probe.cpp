#include <cmath>
#include <iostream>
#include <string>

#include <oocmd.hpp>

#include <pm/result.hpp>
#include <pm/stopwatch.hpp>

#include "catalog.hpp"

using namespace oocmd;

struct Probe : public ConfigObject {
    std::string type = "percent";
    bool list = false;
    bool quiet = false;

    Probe() : ConfigObject("bounded-probe", "Checks integers against a catalog of bounded integer types.") {
        param('t', "type", type, "The catalog type to check the values against.");
        param('l', "list", list, "List the catalog types and exit.");
        param('q', "quiet", quiet, "Only print the result line.");
    }

    int run(Application const& app) {
        if(list) {
            for(auto const& e : catalog()) {
                std::cout << e.name << "\t" << e.label << std::endl;
            }
            return 0;
        }

        auto const* entry = find_catalog_entry(type);
        if(!entry) {
            std::cerr << "unknown type: " << type << " (use --list to see the catalog)" << std::endl;
            return -1;
        }

        if(app.args().empty()) {
            app.print_usage(*this);
            return -1;
        }

        uint64_t accepted = 0, rejected = 0, invalid = 0;

        pm::Stopwatch t;
        t.start();
        for(auto const& arg : app.args()) {
            auto const v = entry->classify(arg);
            switch(v.kind) {
                case Verdict::accepted:
                    ++accepted;
                    if(!quiet) std::cout << arg << "\t" << v.text << std::endl;
                    break;

                case Verdict::rejected:
                    ++rejected;
                    if(!quiet) std::cout << arg << "\t" << v.text << std::endl;
                    break;

                case Verdict::invalid:
                    ++invalid;
                    std::cerr << arg << "\t" << v.text << std::endl;
                    break;
            }
        }
        t.stop();

        pm::Result result;
        result.add("type", entry->name);
        result.add("accepted", accepted);
        result.add("rejected", rejected);
        result.add("invalid", invalid);
        result.add("time", (uint64_t)std::round(t.elapsed_time_millis()));
        std::cout << result.str() << std::endl;

        return (rejected == 0 && invalid == 0) ? 0 : 1;
    }
};

int main(int argc, char** argv) {
    Probe p;
    return Application::run(p, argc, argv);
}
