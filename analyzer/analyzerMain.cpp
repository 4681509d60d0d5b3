/**
 * \file analyzer/analyzerMain.cpp
 * \brief Entrypoint for the analyzer, choosing between the dashboard and the headless runner.
 */

#ifdef HAS_ANALYZER_UI
#include "analyzer/ui/AnalyzerUI.hpp"
#endif
#include "session/AnalyzerSession.hpp"
#include "AnalyzerOptions.hpp"
#include "logger.hpp"
#include <options/Options.hpp>
#include <iostream>
#include <stdexcept>

/** \brief Entrypoint for the analyzer binary. */
int main(int argc, char* argv[]) {
    try {
        std::string opt_err;
        auto parse_res = procsync_opts::Options::load_and_parse(argc, argv, opt_err);
        if (parse_res == procsync_opts::Options::ParseResult::Help || parse_res == procsync_opts::Options::ParseResult::Version) {
            return 0;
        }
        if (parse_res == procsync_opts::Options::ParseResult::Error) {
            std::cerr << "analyzer option parse error: " << opt_err << std::endl;
            return 2;
        }

        AnalyzerOptions opts;
        try {
            opts = analyzer_opts::resolve();
        } catch (const std::invalid_argument& e) {
            std::cerr << "analyzer option parse error: " << e.what() << std::endl;
            return 2;
        }

        auto logger = std::make_shared<Logger>("Analyzer");

        bool ui_enabled = opts.ui_enabled;
    #ifndef HAS_ANALYZER_UI
        if (ui_enabled) {
            std::cerr << "UI requested but FTXUI not available; running headless." << std::endl;
        }
        ui_enabled = false;
    #endif

        if (ui_enabled) {
            auto vec_sink = std::make_shared<VectorSink>();
            vec_sink->set_level(LogLevel::Info);
            logger->add_sink(vec_sink);
        } else {
            auto stdout_sink = std::make_shared<StdoutSink>();
            stdout_sink->set_level(LogLevel::Info);
            logger->add_sink(stdout_sink);
        }

        auto session = std::make_shared<AnalyzerSession>(opts, logger);
        session->start_monitor();

        if (!ui_enabled) {
            session->run_headless();
            session->shutdown();
            return 0;
        }

#ifdef HAS_ANALYZER_UI
        try {
            auto ui = std::make_shared<AnalyzerUI>(session, logger, opts);
            ui->Run();
        } catch (const std::exception& e) {
            logger->error(std::string{"UI error: "} + e.what());
            session->shutdown();
            return 1;
        }
#endif
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "analyzer error: " << e.what() << std::endl;
        return 1;
    }
}
