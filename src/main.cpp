#include "rangefetch/cli.hpp"
#include "rangefetch/curl_http_client.hpp"
#include "rangefetch/errors.hpp"
#include "rangefetch/parallel_downloader.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <utility>

int main(int argc, char** argv) {
    const char* program_name = argc > 0 ? argv[0] : "rangefetch";
    try {
        const auto command_line = rangefetch::parseArguments(argc, argv);
        if (command_line.show_help) {
            std::cout << rangefetch::usageText(program_name);
            return 0;
        }

        auto client = std::make_shared<rangefetch::CurlHttpClient>();
        rangefetch::ParallelDownloader downloader(command_line.url, std::move(client),
                                                  rangefetch::DownloaderConfig::fromHost());
        downloader.run();

    } catch (const rangefetch::ArgumentError& ex) {
        std::cerr << rangefetch::usageText(program_name);
        rangefetch::exitWithFatalError(ex);
    } catch (const std::exception& ex) {
        rangefetch::exitWithFatalError(ex);
    }
    return 0;
}
