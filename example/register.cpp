#include "zeroconf_cpp/zeroconf.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

int main(int argc, char* argv[])
{
    const std::string address = argc > 1 ? argv[1] : "127.0.0.1";
    const auto packed = zeroconf_cpp::ParseAddress(address);
    if (!packed) {
        std::cerr << "Not an IP address: " << address << "\n";
        return 1;
    }

    zeroconf_cpp::ServiceInfoSettings settings;
    settings.type = "_http._tcp.local.";
    settings.name = "Zeroconf Example._http._tcp.local.";
    settings.addresses = {*packed};
    settings.port = 8080;
    settings.properties = {{"path", std::string("/")}, {"version", std::string("1.0")}};
    settings.server = "zeroconf-example.local.";
    auto info = std::make_shared<zeroconf_cpp::ServiceInfo>(settings);

    zeroconf_cpp::Zeroconf zc;
    zc.RegisterService(info, std::nullopt, true);
    std::cout << "Registered " << info->Name() << ", running for 20 seconds.\n";

    std::this_thread::sleep_for(std::chrono::seconds(20));
    zc.UnregisterService(info);
    zc.Close();

    return 0;
}
