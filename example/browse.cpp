#include "zeroconf_cpp/service_browser.hpp"
#include "zeroconf_cpp/zeroconf.hpp"

#include <chrono>
#include <iostream>
#include <thread>

int main(int argc, char* argv[])
{
    const std::string type = argc > 1 ? argv[1] : "_http._tcp.local.";

    zeroconf_cpp::Zeroconf zc;

    auto handler = [](zeroconf_cpp::Zeroconf& zc, const std::string& type, const std::string& name,
                      zeroconf_cpp::ServiceStateChange change) {
        std::cout << "Service " << name << " of type " << type << " state changed: "
                  << zeroconf_cpp::ToString(change) << "\n";
        if (change != zeroconf_cpp::ServiceStateChange::Added) {
            return;
        }
        const auto info = zc.GetServiceInfo(type, name);
        if (!info) {
            std::cout << "  No info\n";
            return;
        }
        for (const auto& address : info->ParsedAddresses()) {
            std::cout << "  Address: " << address << ":" << info->Port() << "\n";
        }
        std::cout << "  Server: " << info->Server() << "\n";
        for (const auto& [key, value] : info->GetProperties()) {
            std::cout << "  " << key << ": " << value.value_or("(no value)") << "\n";
        }
    };

    zeroconf_cpp::ServiceBrowser browser(zc, type, {handler});
    std::this_thread::sleep_for(std::chrono::seconds(20));
    browser.Cancel();
    zc.Close();

    return 0;
}
