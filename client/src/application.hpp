#pragma once

#include <optional>
#include <string>
#include <vector>

#include "download.hpp"
#include "session_config.hpp"

enum class application_mode {
    single,   // one url on the command line
    manifest, // a JSON list of downloads
};

// Command-line front end. Exit codes: 0 success, 1 a download failed, 2 bad usage or
// configuration.
class application {
public:
    static application& instance() {
        static application app;
        return app;
    }

    int run(int argc, char** argv);

    // Remove copy/move constructors
    application(const application&) = delete;
    application& operator=(const application&) = delete;
    application(application&&) = delete;
    application& operator=(application&&) = delete;

private:
    application();
    ~application();

    application_mode m_mode;
    session_config m_config;
    std::vector<download_request> m_requests;

    // Throws config_error.
    bool parse_arguments(int argc, char** argv);
    int run_downloads();
    void print_usage(const char* program);
};
