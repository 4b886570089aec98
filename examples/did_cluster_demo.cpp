/// Multi-node identity demo
/// Creates three device DIDs, links them into one identity cluster, revokes a
/// lost device and shows that the rest of the identity is unaffected.

#include <didlink/didlink.hpp>
#include <iostream>

using namespace didlink;

int main() {
    std::cout << "=== didlink Identity Cluster Demo ===" << std::endl;
    std::cout << std::endl;

    storage::InMemoryDIDStore store;
    DIDManager manager(store);

    // === Part 1: One DID per device ===
    std::cout << "--- Part 1: Creating device DIDs ---" << std::endl;

    auto laptop_result = manager.createDID("laptop");
    auto phone_result = manager.createDID("phone");
    auto tablet_result = manager.createDID("tablet");
    if (!laptop_result.is_ok() || !phone_result.is_ok() || !tablet_result.is_ok()) {
        std::cerr << "Failed to create device DIDs" << std::endl;
        return 1;
    }
    auto laptop = laptop_result.value();
    auto phone = phone_result.value();
    auto tablet = tablet_result.value();

    for (const auto *created : {&laptop, &phone, &tablet}) {
        std::cout << "  " << created->node.getLabel() << ": " << created->node.getDID().substr(0, 28) << "..."
                  << std::endl;
    }
    std::cout << std::endl;

    // === Part 2: Link them ===
    std::cout << "--- Part 2: Linking devices ---" << std::endl;

    auto first_link = manager.linkDIDs(laptop.node.getDID(), laptop.private_key, phone.node.getDID(), phone.private_key);
    if (!first_link.is_ok()) {
        std::cerr << "Link failed: " << first_link.error().message.c_str() << std::endl;
        return 1;
    }
    std::cout << "laptop <-> phone linked into cluster " << first_link.value().getClusterId().substr(0, 8) << std::endl;

    auto second_link =
        manager.linkDIDs(phone.node.getDID(), phone.private_key, tablet.node.getDID(), tablet.private_key);
    if (!second_link.is_ok()) {
        std::cerr << "Link failed: " << second_link.error().message.c_str() << std::endl;
        return 1;
    }
    std::cout << "phone <-> tablet linked" << std::endl;

    auto cluster = manager.resolveIdentity(laptop.node.getDID()).value();
    std::cout << "Cluster " << cluster->getClusterId().substr(0, 8) << " has " << cluster->size() << " members"
              << std::endl;
    std::cout << std::endl;

    // === Part 3: Link authentication ===
    std::cout << "--- Part 3: Rejecting a forged link ---" << std::endl;

    auto intruder = manager.createDID("intruder").value();
    auto forged = manager.linkDIDs(laptop.node.getDID(), intruder.private_key, intruder.node.getDID(),
                                   intruder.private_key);
    std::cout << "Forged link rejected: " << (forged.is_err() ? "yes" : "no") << " ("
              << errorCodeName(forged.is_err() ? forged.error().code : 0) << ")" << std::endl;
    std::cout << std::endl;

    // === Part 4: Revoke a lost device ===
    std::cout << "--- Part 4: Revoking the phone ---" << std::endl;

    auto revoked = manager.revokeDID(phone.node.getDID(), "lost device");
    if (!revoked.is_ok()) {
        std::cerr << "Revocation failed" << std::endl;
        return 1;
    }
    std::cout << "phone status: " << didStatusToString(revoked.value().getStatus()) << std::endl;
    std::cout << "laptop status: " << didStatusToString(manager.getNode(laptop.node.getDID()).value().getStatus())
              << std::endl;

    auto after = manager.resolveIdentity(tablet.node.getDID()).value();
    std::cout << "Cluster still lists phone (audit): " << (after->hasMember(phone.node.getDID()) ? "yes" : "no")
              << std::endl;
    std::cout << std::endl;

    // === Part 5: Audit trail ===
    std::cout << "--- Part 5: Link proofs ---" << std::endl;
    for (const auto &proof : manager.listProofs()) {
        auto valid = manager.verifyProof(proof);
        std::cout << "  " << proof.getDidA().substr(0, 20) << "... <-> " << proof.getDidB().substr(0, 20)
                  << "... valid=" << (valid.is_ok() && valid.value() ? "yes" : "no") << std::endl;
    }

    std::cout << std::endl;
    std::cout << "=== Demo Complete ===" << std::endl;
    return 0;
}
