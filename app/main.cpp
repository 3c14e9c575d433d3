#include "../common/Config.hpp"
#include "../common/Errors.hpp"
#include "../common/MacAddress.hpp"
#include "../discovery/DeviceScanner.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace
{
    std::atomic<bool> g_running(true);

    void HandleSignal(int)
    {
        g_running = false;
    }

    void PrintUsage()
    {
        std::cout << "Usage: lanwatch [--quick] [--watch SECONDS] [--resolve] [--data-dir DIR] [--oui FILE]\n"
                  << "       lanwatch --name MAC NAME [--data-dir DIR]\n"
                  << "       lanwatch --unname MAC [--data-dir DIR]\n";
    }

    std::string Joined(const std::set<std::string> &items)
    {
        std::string out;
        for (const auto &item : items)
        {
            if (!out.empty())
                out += ",";
            out += item;
        }
        return out;
    }

    void PrintDevices(const lanwatch::discovery::DeviceScanner &scanner)
    {
        auto devices = scanner.GetAllDevices();

        std::cout << std::left
                  << std::setw(8) << "STATUS" << std::setw(16) << "IP" << std::setw(19) << "MAC"
                  << std::setw(9) << "TYPE" << std::setw(28) << "NAME" << std::setw(22) << "VENDOR"
                  << std::setw(9) << "OS" << "SERVICES\n";

        for (const auto &dev : devices)
        {
            std::cout << std::setw(8) << (dev.is_online ? "online" : "offline")
                      << std::setw(16) << dev.ip_address
                      << std::setw(19) << dev.mac_address
                      << std::setw(9) << lanwatch::discovery::ToString(dev.device_type)
                      << std::setw(28) << dev.DisplayName().substr(0, 27)
                      << std::setw(22) << dev.vendor.value_or("-").substr(0, 21)
                      << std::setw(9) << dev.os_hint.value_or("-")
                      << Joined(dev.services) << "\n";
        }

        auto counts = scanner.GetDeviceCount();
        std::cout << counts.online << " online / " << counts.total << " total\n";
    }

    std::vector<std::string> MacsOf(const std::vector<lanwatch::discovery::NetworkDevice> &devices)
    {
        std::vector<std::string> macs;
        macs.reserve(devices.size());
        for (const auto &dev : devices)
            macs.push_back(dev.mac_address);
        return macs;
    }
}

int main(int argc, char *argv[])
{
    lanwatch::discovery::ScannerOptions options;
    bool quick = false;
    bool resolve = false;
    int watch_seconds = 0;
    std::string rename_mac;
    std::string rename_to;
    std::string unname_mac;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;

            if (arg == "--quick")
                quick = true;
            else if (arg == "--resolve")
                resolve = true;
            else if (arg == "--watch" && has_value)
                watch_seconds = std::stoi(argv[++i]);
            else if (arg == "--data-dir" && has_value)
                options.data_dir = argv[++i];
            else if (arg == "--oui" && has_value)
                options.oui_file = argv[++i];
            else if (arg == "--name" && i + 2 < argc)
            {
                rename_mac = argv[++i];
                rename_to = argv[++i];
            }
            else if (arg == "--unname" && has_value)
                unname_mac = argv[++i];
            else
            {
                PrintUsage();
                return 1;
            }
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        PrintUsage();
        return 1;
    }

    if (watch_seconds < 0)
    {
        PrintUsage();
        return 1;
    }
    if (watch_seconds > 0)
    {
        auto interval = std::chrono::milliseconds(std::chrono::seconds(watch_seconds));
        if (interval < options.settings.min_scan_interval)
            options.settings.min_scan_interval = interval;
    }

    try
    {
        lanwatch::discovery::DeviceScanner scanner(options);

        if (!rename_mac.empty())
        {
            scanner.SetDeviceName(rename_mac, rename_to);
            std::cout << "[Names] " << lanwatch::common::mac::Normalize(rename_mac) << " is now \"" << rename_to << "\"\n";
            return 0;
        }
        if (!unname_mac.empty())
        {
            scanner.ClearDeviceName(unname_mac);
            std::cout << "[Names] Custom name removed for " << lanwatch::common::mac::Normalize(unname_mac) << "\n";
            return 0;
        }

        if (watch_seconds == 0)
        {
            if (!scanner.Scan(true, quick))
                std::cerr << "[lanwatch] Scan did not run\n";
            if (resolve)
                scanner.ResolveMissingHostnames();
            PrintDevices(scanner);
            return 0;
        }

        std::signal(SIGINT, HandleSignal);
        std::signal(SIGTERM, HandleSignal);

        if (resolve)
            scanner.Start();

        std::cout << "[lanwatch] Watching every " << watch_seconds << "s. Ctrl-C to stop.\n";
        bool first = true;
        while (g_running)
        {
            if (scanner.Scan(first, quick))
            {
                PrintDevices(scanner);
                if (resolve)
                    scanner.RequestResolutionForVisible(MacsOf(scanner.GetAllDevices()));
            }
            first = false;

            for (int waited = 0; g_running && waited < watch_seconds * 10; ++waited)
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        scanner.Stop();
    }
    catch (const lanwatch::common::FormatError &e)
    {
        std::cerr << "Invalid MAC address: " << e.what() << "\n";
        return 1;
    }
    catch (const lanwatch::common::PersistenceError &e)
    {
        std::cerr << "Could not save names to " << e.Path() << ": " << e.what() << "\n";
        return 2;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal Error: " << e.what() << '\n';
        return -1;
    }

    return 0;
}
