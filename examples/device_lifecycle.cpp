#include <iostream>
#include <string>

#include "trustlock/trustlock.hpp"

int main() {
    trustlock::DeviceTrustService service;

    trustlock::RegistrationRequest request;
    request.account_token = "acct-demo";
    request.mac_address = "aa:bb:cc:dd:ee:ff";
    request.device_fingerprint = "demo-fingerprint";
    request.device_name = "Lobby Kiosk";
    request.device_type = "KIOSK";
    request.os = "Linux";

    auto registered = service.request_registration(request);
    if (!registered) {
        std::cerr << "Registration failed: " << registered.error().message << "\n";
        return 1;
    }
    const auto device_id = registered.value().device.device_id;
    std::cout << "Registered " << device_id << " (" << trustlock::to_string(registered.value().device.status)
              << ")\n";

    auto approved = service.approve_registration(device_id, "admin");
    if (!approved) {
        std::cerr << "Approval failed: " << approved.error().message << "\n";
        return 1;
    }
    const auto &certificate = approved.value().certificate;
    std::cout << "Issued " << certificate.serial_number << " to " << certificate.subject_dn << "\n"
              << "Fingerprint " << certificate.fingerprint << "\n"
              << approved.value().installation_instructions << "\n";

    auto verdict = service.validate_device(certificate.serial_number, request.mac_address, request.device_fingerprint);
    std::cout << "Validation: " << (trustlock::is_valid(verdict) ? "valid" : trustlock::reason_of(verdict)) << "\n";

    auto spoofed = service.validate_device(certificate.serial_number, "11:22:33:44:55:66", request.device_fingerprint);
    std::cout << "Spoofed MAC: " << trustlock::reason_of(spoofed)
              << (trustlock::is_security_alert(spoofed) ? " [security alert]" : "") << "\n";

    auto revoked = service.revoke_certificate(device_id, "admin", "Kiosk decommissioned");
    if (!revoked) {
        std::cerr << "Revocation failed: " << revoked.error().message << "\n";
        return 1;
    }
    verdict = service.validate_device(certificate.serial_number, request.mac_address, request.device_fingerprint);
    std::cout << "After revocation: " << trustlock::reason_of(verdict) << "\n";

    const auto crl = service.get_crl();
    std::cout << "CRL: " << crl.total_revoked << " entries, checksum " << crl.checksum << "\n";
    return 0;
}
