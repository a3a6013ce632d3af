#include "metron/app.hh"
#include "metron/descriptors.hh"
#include "metron/driver.hh"
#include "metron/engine.hh"
#include "metron/error.hh"
#include "metron/input.hh"
#include "metron/json.hh"
#include "metron/logging.hh"
#include "metron/resolver.hh"
#include "metron/snapshot.hh"

#include <string.h>
#include <iostream>

using namespace metron;

struct metrond_config : app_config {
    std::string meter;
    long tick;
    long flush_interval;
    long clear_interval;
    long ignore_older_than;
    std::vector<unsigned> rates;
    std::vector<std::string> add_tag;
    std::string host;
    std::string input;

    engine_config engine() const {
        engine_config ec;
        ec.meter = meter;
        ec.tick = std::chrono::seconds{tick};
        ec.flush_interval = std::chrono::seconds{flush_interval};
        ec.clear_interval = std::chrono::seconds{clear_interval};
        ec.ignore_older_than = std::chrono::seconds{ignore_older_than};
        if (!rates.empty())
            ec.rates = rates;
        ec.host = host;
        ec.add_tag = add_tag;
        return ec;
    }
};

static metrond_config conf;

static fd_base open_input(const std::string &path) {
    if (path == "-")
        return dup_fd(STDIN_FILENO);
    file_fd f(path.c_str(), O_RDONLY);
    return std::move(f);
}

static void count_record(const std::string &line, const key_resolver &resolver, engine &e) {
    if (line.empty())
        return;
    json record;
    try {
        record = json::load(line);
    } catch (errorx &ex) {
        LOG(WARNING) << "skipping unparsable record: " << ex.what();
        return;
    }
    if (!record.is_object()) {
        LOG(WARNING) << "skipping record that is not an object: " << line;
        return;
    }
    const auto r = resolver.resolve(record);
    e.mark(r.key, r.timestamp);
}

int main(int argc, char *argv[]) {
    application app("0.1.0", conf, "metrond");
    namespace po = boost::program_options;
    app.usage = "usage: metrond --meter TEMPLATE [options] < records.json";
    app.usage_example = "example: metrond --meter 'http_%{response}' --flush-interval 10 --add-tag metric";
    app.opts.configuration.add_options()
        ("meter", po::value(&conf.meter), "metric key template, e.g. http_%{response} or %{[req][verb]}")
        ("tick", po::value(&conf.tick)->default_value(5), "rate tick and flush cadence (seconds)")
        ("flush-interval", po::value(&conf.flush_interval)->default_value(5), "emit each meter this often (seconds, multiple of tick)")
        ("clear-interval", po::value(&conf.clear_interval)->default_value(-1), "reset each meter this often (seconds, multiple of tick, -1 never)")
        ("ignore-older-than", po::value(&conf.ignore_older_than)->default_value(0), "skip records whose @timestamp is older than this (seconds, 0 off)")
        ("rate", po::value(&conf.rates)->composing(), "rate window to compute, 1, 5 or 15 minutes (repeatable, default all)")
        ("add-tag", po::value(&conf.add_tag)->composing(), "tag added to every emitted metric (repeatable)")
        ("host", po::value(&conf.host)->default_value(""), "host field of emitted metrics (default hostname)")
        ("input", po::value(&conf.input)->default_value("-"), "newline-delimited JSON records, - for stdin")
        ;
    app.parse_args(argc, argv);

    if (conf.meter.empty()) {
        std::cerr << "Error: --meter is required" << std::endl << std::endl;
        app.showhelp();
        return 1;
    }

    try {
        // block these before any thread starts so only the signal fd sees them
        sigset_t sigset;
        sigemptyset(&sigset);
        sigaddset(&sigset, SIGINT);
        sigaddset(&sigset, SIGTERM);
        signal_fd sigfd{sigset};

        auto clock = std::make_shared<system_clock_source>();
        engine e(conf.engine(), clock);
        key_resolver resolver(conf.meter, clock);
        line_input input(open_input(conf.input), sigfd);
        stream_sink sink(std::cout);
        flush_driver driver(e, sink);

        LOG(INFO) << "metering " << conf.meter << " from " << conf.input
            << " every " << e.config().flush_interval.count() << "s on " << e.config().host;

        std::string line;
        for (;;) {
            const auto r = input.next(line);
            if (r == line_input::got_line) {
                count_record(line, resolver, e);
                continue;
            }
            if (r == line_input::interrupted)
                LOG(INFO) << strsignal(input.signo());
            else
                LOG(INFO) << "end of input";
            break;
        }
        driver.stop();
        LOG(INFO) << e.registry().size() << " meters after " << driver.cycles() << " flush cycles";
    } catch (config_error &ex) {
        LOG(ERROR) << "configuration: " << ex.what();
        return 1;
    } catch (errorx &ex) {
        LOG(ERROR) << ex.what();
        return 1;
    }
    return 0;
}
