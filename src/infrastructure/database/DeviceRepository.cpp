#include "infrastructure/database/DeviceRepository.hpp"

#include <spdlog/spdlog.h>

namespace vlanvision::infra {

namespace {

constexpr const char* SELECT_DEVICE = R"(
    SELECT id, ip_address, mac_address, hostname, device_class, vendor, sys_descr, sys_object_id,
           location, vlan_id, cpu_percent, uptime_ticks, reachability, consecutive_misses,
           merged_into, first_seen, last_seen
    FROM devices
)";

} // namespace

DeviceRepository::DeviceRepository(std::shared_ptr<Database> db) : db_(std::move(db)) {}

void DeviceRepository::saveSnapshot(const std::vector<core::Device>& devices) {
    db_->transaction([this, &devices] {
        db_->execute("DELETE FROM devices");
        for (const auto& device : devices) {
            insertDevice(device);
        }
    });
    spdlog::debug("Saved snapshot of {} devices", devices.size());
}

void DeviceRepository::save(const core::Device& device) {
    db_->transaction([this, &device] {
        auto stmt = db_->prepare("DELETE FROM devices WHERE id = ?");
        stmt.bind(1, device.id);
        stmt.step();
        insertDevice(device);
    });
}

void DeviceRepository::remove(core::DeviceId id) {
    auto stmt = db_->prepare("DELETE FROM devices WHERE id = ?");
    stmt.bind(1, id);
    stmt.step();
    spdlog::debug("Removed device: {}", id);
}

void DeviceRepository::insertDevice(const core::Device& device) {
    auto stmt = db_->prepare(R"(
        INSERT INTO devices (id, ip_address, mac_address, hostname, device_class, vendor, sys_descr,
                             sys_object_id, location, vlan_id, cpu_percent, uptime_ticks, reachability,
                             consecutive_misses, merged_into, first_seen, last_seen)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    )");

    stmt.bind(1, device.id);
    stmt.bind(2, device.ipAddress);
    stmt.bind(3, device.macAddress);
    stmt.bind(4, device.hostname);
    stmt.bind(5, static_cast<int>(device.deviceClass));
    stmt.bind(6, device.vendor);
    stmt.bind(7, device.sysDescr);
    stmt.bind(8, device.sysObjectId);
    stmt.bind(9, device.location);
    if (device.vlanId) {
        stmt.bind(10, *device.vlanId);
    } else {
        stmt.bindNull(10);
    }
    if (device.cpuPercent) {
        stmt.bind(11, *device.cpuPercent);
    } else {
        stmt.bindNull(11);
    }
    if (device.uptimeTicks) {
        stmt.bind(12, static_cast<int64_t>(*device.uptimeTicks));
    } else {
        stmt.bindNull(12);
    }
    stmt.bind(13, static_cast<int>(device.reachability));
    stmt.bind(14, device.consecutiveMisses);
    if (device.mergedInto) {
        stmt.bind(15, *device.mergedInto);
    } else {
        stmt.bindNull(15);
    }
    stmt.bind(16, Database::formatTimestamp(device.firstSeen));
    stmt.bind(17, Database::formatTimestamp(device.lastSeen));
    stmt.step();

    if (!device.interfaces.empty()) {
        auto ifStmt = db_->prepare(R"(
            INSERT INTO device_interfaces (device_id, if_index, name, mac_address, admin_status,
                                           oper_status, speed_bps, in_octets, out_octets, in_errors,
                                           out_errors, utilization)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        )");
        for (const auto& iface : device.interfaces) {
            ifStmt.bind(1, device.id);
            ifStmt.bind(2, iface.index);
            ifStmt.bind(3, iface.name);
            ifStmt.bind(4, iface.macAddress);
            ifStmt.bind(5, static_cast<int>(iface.adminStatus));
            ifStmt.bind(6, static_cast<int>(iface.operStatus));
            ifStmt.bind(7, static_cast<int64_t>(iface.speedBps));
            ifStmt.bind(8, static_cast<int64_t>(iface.inOctets));
            ifStmt.bind(9, static_cast<int64_t>(iface.outOctets));
            ifStmt.bind(10, static_cast<int64_t>(iface.inErrors));
            ifStmt.bind(11, static_cast<int64_t>(iface.outErrors));
            if (iface.utilizationPercent) {
                ifStmt.bind(12, *iface.utilizationPercent);
            } else {
                ifStmt.bindNull(12);
            }
            ifStmt.step();
            ifStmt.reset();
        }
    }

    if (!device.neighbors.empty()) {
        auto nbStmt = db_->prepare(R"(
            INSERT INTO device_neighbors (device_id, protocol, local_port, remote_device_id,
                                          remote_port, remote_address, remote_chassis_mac, remote_platform)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?)
        )");
        for (const auto& neighbor : device.neighbors) {
            nbStmt.bind(1, device.id);
            nbStmt.bind(2, static_cast<int>(neighbor.protocol));
            nbStmt.bind(3, neighbor.localPort);
            nbStmt.bind(4, neighbor.remoteDeviceId);
            nbStmt.bind(5, neighbor.remotePort);
            nbStmt.bind(6, neighbor.remoteAddress);
            nbStmt.bind(7, neighbor.remoteChassisMac);
            nbStmt.bind(8, neighbor.remotePlatform);
            nbStmt.step();
            nbStmt.reset();
        }
    }

    if (!device.ipHistory.empty()) {
        auto histStmt = db_->prepare("INSERT INTO device_ip_history (device_id, address, last_seen) VALUES (?, ?, ?)");
        for (const auto& entry : device.ipHistory) {
            histStmt.bind(1, device.id);
            histStmt.bind(2, entry.address);
            histStmt.bind(3, Database::formatTimestamp(entry.lastSeen));
            histStmt.step();
            histStmt.reset();
        }
    }
}

std::optional<core::Device> DeviceRepository::findById(core::DeviceId id) {
    auto stmt = db_->prepare(std::string(SELECT_DEVICE) + " WHERE id = ?");
    stmt.bind(1, id);

    if (stmt.step()) {
        auto device = rowToDevice(stmt);
        loadOwnedRows(device);
        return device;
    }
    return std::nullopt;
}

std::vector<core::Device> DeviceRepository::findAll() {
    std::vector<core::Device> devices;
    {
        auto stmt = db_->prepare(std::string(SELECT_DEVICE) + " ORDER BY id");
        while (stmt.step()) {
            devices.push_back(rowToDevice(stmt));
        }
    }
    for (auto& device : devices) {
        loadOwnedRows(device);
    }
    return devices;
}

int DeviceRepository::count() {
    auto stmt = db_->prepare("SELECT COUNT(*) FROM devices");
    stmt.step();
    return stmt.columnInt(0);
}

void DeviceRepository::loadOwnedRows(core::Device& device) {
    auto ifStmt = db_->prepare(R"(
        SELECT if_index, name, mac_address, admin_status, oper_status, speed_bps, in_octets,
               out_octets, in_errors, out_errors, utilization
        FROM device_interfaces WHERE device_id = ? ORDER BY if_index
    )");
    ifStmt.bind(1, device.id);
    while (ifStmt.step()) {
        core::Interface iface;
        iface.index = ifStmt.columnInt(0);
        iface.name = ifStmt.columnText(1);
        iface.macAddress = ifStmt.columnText(2);
        iface.adminStatus = core::interfaceStatusFromInt(ifStmt.columnInt(3));
        iface.operStatus = core::interfaceStatusFromInt(ifStmt.columnInt(4));
        iface.speedBps = static_cast<uint64_t>(ifStmt.columnInt64(5));
        iface.inOctets = static_cast<uint64_t>(ifStmt.columnInt64(6));
        iface.outOctets = static_cast<uint64_t>(ifStmt.columnInt64(7));
        iface.inErrors = static_cast<uint64_t>(ifStmt.columnInt64(8));
        iface.outErrors = static_cast<uint64_t>(ifStmt.columnInt64(9));
        if (!ifStmt.columnIsNull(10)) {
            iface.utilizationPercent = ifStmt.columnDouble(10);
        }
        device.interfaces.push_back(std::move(iface));
    }

    auto nbStmt = db_->prepare(R"(
        SELECT protocol, local_port, remote_device_id, remote_port, remote_address,
               remote_chassis_mac, remote_platform
        FROM device_neighbors WHERE device_id = ? ORDER BY id
    )");
    nbStmt.bind(1, device.id);
    while (nbStmt.step()) {
        core::LinkNeighbor neighbor;
        neighbor.protocol = nbStmt.columnInt(0) == static_cast<int>(core::NeighborProtocol::Lldp)
                                ? core::NeighborProtocol::Lldp
                                : core::NeighborProtocol::Cdp;
        neighbor.localPort = nbStmt.columnText(1);
        neighbor.remoteDeviceId = nbStmt.columnText(2);
        neighbor.remotePort = nbStmt.columnText(3);
        neighbor.remoteAddress = nbStmt.columnText(4);
        neighbor.remoteChassisMac = nbStmt.columnText(5);
        neighbor.remotePlatform = nbStmt.columnText(6);
        device.neighbors.push_back(std::move(neighbor));
    }

    auto histStmt = db_->prepare("SELECT address, last_seen FROM device_ip_history WHERE device_id = ? ORDER BY id");
    histStmt.bind(1, device.id);
    while (histStmt.step()) {
        device.ipHistory.push_back({histStmt.columnText(0), Database::parseTimestamp(histStmt.columnText(1))});
    }
}

core::Device DeviceRepository::rowToDevice(Statement& stmt) {
    core::Device device;
    device.id = stmt.columnInt64(0);
    device.ipAddress = stmt.columnText(1);
    device.macAddress = stmt.columnText(2);
    device.hostname = stmt.columnText(3);
    device.deviceClass = static_cast<core::DeviceClass>(stmt.columnInt(4));
    device.vendor = stmt.columnText(5);
    device.sysDescr = stmt.columnText(6);
    device.sysObjectId = stmt.columnText(7);
    device.location = stmt.columnText(8);
    if (!stmt.columnIsNull(9)) {
        device.vlanId = stmt.columnInt(9);
    }
    if (!stmt.columnIsNull(10)) {
        device.cpuPercent = stmt.columnDouble(10);
    }
    if (!stmt.columnIsNull(11)) {
        device.uptimeTicks = static_cast<uint64_t>(stmt.columnInt64(11));
    }
    device.reachability = static_cast<core::Reachability>(stmt.columnInt(12));
    device.consecutiveMisses = stmt.columnInt(13);
    if (!stmt.columnIsNull(14)) {
        device.mergedInto = stmt.columnInt64(14);
    }
    device.firstSeen = Database::parseTimestamp(stmt.columnText(15));
    device.lastSeen = Database::parseTimestamp(stmt.columnText(16));
    return device;
}

} // namespace vlanvision::infra
