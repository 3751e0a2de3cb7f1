#pragma once

#include <string>
#include <memory>

#include <QStringList>
#include <spdlog/logger.h>

#include "config.hpp"

class WebApi;
class MetadataClient;

enum ExitCode {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_INVALID_REFERENCE = 2,
    EXIT_REMOTE = 3,
    EXIT_TAGGING = 4
};

class Application {
    public:
        Application(const Config &config, std::shared_ptr<spdlog::logger> logger);
        ~Application();

        // args: command followed by its arguments
        int run(const QStringList &args);
        void set_format(const std::string &name) { format = name; }

    private:
        Config config;
        std::shared_ptr<spdlog::logger> logger;
        std::unique_ptr<WebApi> api;
        std::unique_ptr<MetadataClient> client;

        // Codec name forced on the command line, empty to detect
        std::string format;

        void connect();
        void resolve(const std::string &input);
        void list(const std::string &input);
        void search(const std::string &query);
        void tag(const std::string &input, const std::string &file);
};
