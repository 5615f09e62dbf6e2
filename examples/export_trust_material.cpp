#include <fstream>
#include <iostream>
#include <string>

#include "trustlock/trustlock.hpp"

namespace {

    bool write_file(const std::string &path, const std::string &contents) {
        std::ofstream out(path, std::ios::binary);
        if (!out) {
            return false;
        }
        out << contents;
        return static_cast<bool>(out);
    }

} // namespace

int main(int argc, char **argv) {
    const std::string prefix = argc > 1 ? argv[1] : "trustlock";

    trustlock::TrustConfig config;
    config.ca_distinguished_name = "CN=Example Device CA, O=Example, C=US";
    trustlock::DeviceTrustService service(config);

    auto ca_pem = service.ca_certificate_pem();
    if (!ca_pem) {
        std::cerr << "CA unavailable: " << ca_pem.error().message << "\n";
        return 1;
    }

    trustlock::RegistrationRequest request;
    request.account_token = "acct-export";
    request.mac_address = "02:00:00:00:00:01";
    auto registered = service.request_registration(request);
    if (!registered) {
        std::cerr << "Registration failed: " << registered.error().message << "\n";
        return 1;
    }
    auto approved = service.approve_registration(registered.value().device.device_id, "admin");
    if (!approved) {
        std::cerr << "Approval failed: " << approved.error().message << "\n";
        return 1;
    }
    auto removed = service.remove_device(registered.value().device.device_id, "owner");
    if (!removed) {
        std::cerr << "Removal failed: " << removed.error().message << "\n";
        return 1;
    }

    auto crl = service.export_signed_crl();
    if (!crl) {
        std::cerr << "CRL export failed: " << crl.error().message << "\n";
        return 1;
    }

    if (!write_file(prefix + "_ca.pem", ca_pem.value()) || !write_file(prefix + "_crl.pem", crl.value().pem) ||
        !write_file(prefix + "_device.pem", approved.value().certificate.certificate_pem)) {
        std::cerr << "Unable to write output files\n";
        return 1;
    }
    std::cout << "Wrote " << prefix << "_ca.pem, " << prefix << "_device.pem and " << prefix << "_crl.pem ("
              << crl.value().entry_count << " revoked)\n";
    return 0;
}
