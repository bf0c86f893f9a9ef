/*
 * Copyright (C) 2013 Emeric Poupon
 *
 * This file is part of MTG.
 *
 * MTG is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * MTG is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with MTG.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <unistd.h>

#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>
#include <vector>

#include <Wt/WLogSink.h>
#include <Wt/WServer.h>
#include <boost/asio/io_context.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/IOContextRunner.hpp"
#include "core/ITimer.hpp"
#include "core/Service.hpp"
#include "core/SizeLiterals.hpp"
#include "database/IDb.hpp"
#include "database/PolicyResolver.hpp"
#include "database/Session.hpp"
#include "objectstore/FsObjectStore.hpp"
#include "transfer/IDownloadStreamer.hpp"
#include "transfer/IUploadReceiver.hpp"
#include "transfer/TransferSettings.hpp"

#include "resources/DownloadResource.hpp"
#include "resources/HealthResource.hpp"
#include "resources/HttpUtils.hpp"
#include "resources/UploadResource.hpp"

namespace mtg
{
    namespace
    {
        using namespace core::literals;

        std::size_t getThreadCount()
        {
            const unsigned long configHttpServerThreadCount{ core::Service<core::IConfig>::get()->getULong("http-server-thread-count", 0) };

            // Uploads block a thread until the object is stored
            return configHttpServerThreadCount ? configHttpServerThreadCount : std::max<unsigned long>(2, std::thread::hardware_concurrency());
        }

        std::size_t getIOThreadCount()
        {
            const unsigned long configIOThreadCount{ core::Service<core::IConfig>::get()->getULong("io-thread-count", 0) };

            return configIOThreadCount ? configIOThreadCount : std::max<unsigned long>(1, std::thread::hardware_concurrency());
        }

        // Wt receives the whole body before any resource sees it: this is only the outer bound
        std::uint64_t getMaxRequestSize()
        {
            std::uint64_t maxSize{};
            for (transfer::MediaCategory category : transfer::mediaCategories)
                maxSize = std::max(maxSize, transfer::readCategoryPolicy(*core::Service<core::IConfig>::get(), category).maxSizeBytes);

            return gateway::getMaxRequestSize(maxSize);
        }

        std::vector<std::string> generateWtConfig(std::string execPath)
        {
            core::IConfig& config{ *core::Service<core::IConfig>::get() };

            std::vector<std::string> args;

            const std::filesystem::path workingDir{ config.getPath("working-dir", "/var/mtg") };
            const std::filesystem::path wtConfigPath{ workingDir / "wt_config.xml" };
            const std::filesystem::path docRoot{ workingDir / "docroot" };
            std::filesystem::create_directories(docRoot);

            args.push_back(execPath);
            args.push_back("--config=" + wtConfigPath.string());
            args.push_back("--docroot=" + docRoot.string());
            args.push_back("--http-port=" + std::to_string(config.getULong("listen-port", 5090)));
            args.push_back("--http-address=" + std::string{ config.getString("listen-addr", "0.0.0.0") });
            args.push_back("--threads=" + std::to_string(getThreadCount()));

            // Generate the wt_config.xml file
            boost::property_tree::ptree pt;

            pt.put("server.application-settings.<xmlattr>.location", "*");
            pt.put("server.application-settings.max-request-size", std::to_string(getMaxRequestSize() / 1_KiB));

            // Reverse proxy
            if (config.getBool("behind-reverse-proxy", false))
            {
                pt.put("server.application-settings.trusted-proxy-config.original-ip-header", std::string{ config.getString("original-ip-header", "X-Forwarded-For") });
                config.visitStrings("trusted-proxies", [&](std::string_view trustedProxy) {
                    pt.add("server.application-settings.trusted-proxy-config.trusted-proxies.proxy", std::string{ trustedProxy });
                },
                    { "127.0.0.1", "::1" });
            }

            {
                std::ofstream oss{ wtConfigPath, std::ios::out };
                if (!oss)
                    throw core::MtgException{ "Can't open '" + wtConfigPath.string() + "' for writing!" };

                boost::property_tree::xml_parser::write_xml(oss, pt);

                if (!oss)
                    throw core::MtgException{ "Can't write in file '" + wtConfigPath.string() + "', no space left?" };
            }

            return args;
        }

        core::logging::Severity getLogMinSeverity()
        {
            std::string_view minSeverity{ core::Service<core::IConfig>::get()->getString("log-min-severity", "info") };

            if (minSeverity == "debug")
                return core::logging::Severity::DEBUG;
            else if (minSeverity == "info")
                return core::logging::Severity::INFO;
            else if (minSeverity == "warning")
                return core::logging::Severity::WARNING;
            else if (minSeverity == "error")
                return core::logging::Severity::ERROR;
            else if (minSeverity == "fatal")
                return core::logging::Severity::FATAL;

            throw core::MtgException{ "Invalid config value for 'log-min-severity'" };
        }

        class MtgLogSink : public Wt::WLogSink
        {
        public:
            MtgLogSink(core::logging::ILogger& logger)
                : _logger{ logger }
            {
            }

        private:
            void log(const std::string& type, const std::string& scope, const std::string& message) const noexcept override
            {
                // Some wt code path may go here without testing logging()
                if (logging(type, scope))
                {
                    const core::logging::Severity severity{ getSeverity(type, scope) };
                    _logger.processLog(core::logging::Module::WT, severity, message);
                }
            }

            bool logging(const std::string& type, const std::string& scope) const noexcept override
            {
                const core::logging::Severity severity{ getSeverity(type, scope) };
                return _logger.isSeverityActive(severity);
            }

            static core::logging::Severity getSeverity(const std::string& type, const std::string& scope)
            {
                return adjustSeverity(getSeverityFromString(type), scope);
            }

            static core::logging::Severity adjustSeverity(core::logging::Severity initialSeverity, std::string_view scope)
            {
                // one line per request is too verbose for INFO
                if (initialSeverity == core::logging::Severity::INFO && (scope == "WebRequest" || scope == "wthttp"))
                    return core::logging::Severity::DEBUG;

                return initialSeverity;
            }

            static core::logging::Severity getSeverityFromString(std::string_view type)
            {
                if (type == "debug")
                    return core::logging::Severity::DEBUG;
                if (type == "info")
                    return core::logging::Severity::INFO;
                if (type == "warning")
                    return core::logging::Severity::WARNING;
                if (type == "error")
                    return core::logging::Severity::ERROR;
                if (type == "fatal")
                    return core::logging::Severity::FATAL;

                return core::logging::Severity::INFO;
            }

            core::logging::ILogger& _logger;
        };
    } // namespace

    int main(int argc, char* argv[])
    {
        std::filesystem::path configFilePath{ "/etc/mtg.conf" };
        int res{ EXIT_FAILURE };

        assert(argc > 0);
        assert(argv[0] != NULL);

        auto displayUsage{ [&](std::ostream& os) {
            os << "Usage:\t" << argv[0] << "\t[conf_file]\n\n"
               << "Options:\n"
               << "\tconf_file:\t path to the MTG configuration file (defaults to " << configFilePath << ")\n\n";
        } };

        if (argc == 2)
        {
            const std::string_view arg{ argv[1] };
            if (arg == "-h" || arg == "--help")
            {
                displayUsage(std::cout);
                return EXIT_SUCCESS;
            }
            configFilePath = std::string(arg, 0, 256);
        }
        else if (argc > 2)
        {
            displayUsage(std::cerr);
            return EXIT_FAILURE;
        }

        try
        {
            close(STDIN_FILENO);

            core::Service<core::IConfig> config{ core::createConfig(configFilePath) };
            core::Service<core::logging::ILogger> logger{ core::logging::createLogger(getLogMinSeverity(), config->getPath("log-file", "")) };

            // Make sure the working directories exist
            const std::filesystem::path workingDir{ config->getPath("working-dir", "/var/mtg") };
            const std::filesystem::path uploadTempDir{ config->getPath("upload-temp-dir", workingDir / "tmp") };
            std::filesystem::create_directories(workingDir);
            std::filesystem::create_directories(uploadTempDir);

            const transfer::TransferSettings transferSettings{ transfer::readTransferSettings(*config) };

            // Construct WT configuration and get the argc/argv back
            const std::vector<std::string> wtServerArgs{ generateWtConfig(argv[0]) };

            std::vector<const char*> wtArgv(wtServerArgs.size());
            for (std::size_t i = 0; i < wtServerArgs.size(); ++i)
            {
                MTG_LOG(MAIN, DEBUG, "Wt argument: " << wtServerArgs[i]);
                wtArgv[i] = wtServerArgs[i].c_str();
            }

            MtgLogSink mtgLogSink{ *logger };
            Wt::WServer server{ argv[0] };
            server.setCustomLogger(mtgLogSink);
            server.setServerConfiguration(wtServerArgs.size(), const_cast<char**>(&wtArgv[0]));

            boost::asio::io_context ioContext; // hosts all the transfer sessions, out of the Wt event loop

            auto objectStore{ objectstore::createFsObjectStore(config->getPath("object-store-dir", workingDir / "store"), config->getULong("object-store-thread-count", 4)) };

            // Connection pool size must be twice the number of threads: each http thread may access the database
            auto database{ db::createDb(workingDir / "mtg.db", getThreadCount() * 2) };
            {
                db::Session& session{ database->getTLSSession() };
                session.prepareTablesIfNeeded();
                session.createIndexesIfNeeded();

                // config values only seed missing rows, the table is the reference afterwards
                db::initCategorySettings(session, [&](transfer::MediaCategory category) {
                    return transfer::readCategoryPolicy(*config, category);
                });
            }
            auto policyResolver{ db::createPolicyResolver(*database) };

            auto timerFactory{ core::createAsioTimerFactory(ioContext) };
            auto downloadStreamer{ transfer::createDownloadStreamer(ioContext, *objectStore, *timerFactory, transferSettings) };
            auto uploadReceiver{ transfer::createUploadReceiver(*objectStore, *timerFactory, transferSettings, uploadTempDir) };

            // Service initialization order is important (reverse-order for deinit)
            core::IOContextRunner ioContextRunner{ ioContext, getIOThreadCount(), "Transfer" };

            gateway::DownloadResource downloadResource{ *downloadStreamer, *policyResolver };
            gateway::UploadResource uploadResource{ *uploadReceiver, *policyResolver };
            gateway::HealthResource healthResource{ *policyResolver, *objectStore, transferSettings.metadataTimeout };

            server.addResource(&downloadResource, "/api/stream");
            server.addResource(&uploadResource, "/api/upload");
            server.addResource(&healthResource, "/api/health");

            MTG_LOG(MAIN, INFO, "Starting web server...");
            server.start();

            MTG_LOG(MAIN, INFO, "Now running...");
            Wt::WServer::waitForShutdown();

            MTG_LOG(MAIN, INFO, "Stopping server...");
            server.stop();
            ioContextRunner.stop();

            MTG_LOG(MAIN, INFO, "Quitting...");
            res = EXIT_SUCCESS;
        }
        catch (const Wt::WServer::Exception& e)
        {
            MTG_LOG(MAIN, FATAL, "Caught WServer::Exception: " << e.what());
            std::cerr << "Caught a WServer::Exception: " << e.what() << std::endl;
            res = EXIT_FAILURE;
        }
        catch (const std::exception& e)
        {
            MTG_LOG(MAIN, FATAL, "Caught std::exception: " << e.what());
            std::cerr << "Caught std::exception: " << e.what() << std::endl;
            res = EXIT_FAILURE;
        }

        return res;
    }
} // namespace mtg

int main(int argc, char* argv[])
{
    return mtg::main(argc, argv);
}
