#include "infrastructure/database/AlertRepository.hpp"

#include <spdlog/spdlog.h>

namespace vlanvision::infra {

AlertRepository::AlertRepository(std::shared_ptr<Database> db) : db_(std::move(db)) {}

void AlertRepository::save(const core::Alert& alert) {
    auto stmt = db_->prepare(R"(
        INSERT INTO alerts (id, device_id, interface_index, interface_name, rule, severity, message,
                            first_fired, last_seen, resolved_at, acknowledged)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(id) DO UPDATE SET
            severity = excluded.severity, message = excluded.message, last_seen = excluded.last_seen,
            resolved_at = excluded.resolved_at, acknowledged = excluded.acknowledged
    )");

    stmt.bind(1, alert.id);
    stmt.bind(2, alert.deviceId);
    if (alert.interfaceIndex) {
        stmt.bind(3, *alert.interfaceIndex);
    } else {
        stmt.bindNull(3);
    }
    stmt.bind(4, alert.interfaceName);
    stmt.bind(5, static_cast<int>(alert.rule));
    stmt.bind(6, static_cast<int>(alert.severity));
    stmt.bind(7, alert.message);
    stmt.bind(8, Database::formatTimestamp(alert.firstFired));
    stmt.bind(9, Database::formatTimestamp(alert.lastSeen));
    if (alert.resolvedAt) {
        stmt.bind(10, Database::formatTimestamp(*alert.resolvedAt));
    } else {
        stmt.bindNull(10);
    }
    stmt.bind(11, alert.acknowledged ? 1 : 0);
    stmt.step();
    spdlog::debug("Saved alert {} ({} on device {})", alert.id, alert.ruleToString(), alert.deviceId);
}

std::vector<core::Alert> AlertRepository::findOpen() {
    return select("WHERE resolved_at IS NULL ORDER BY id", [](Statement&) {});
}

std::vector<core::Alert> AlertRepository::findRecent(int limit) {
    return select("ORDER BY id DESC LIMIT ?", [limit](Statement& stmt) { stmt.bind(1, limit); });
}

std::vector<core::Alert> AlertRepository::findByDevice(core::DeviceId deviceId) {
    return select("WHERE device_id = ? ORDER BY id", [deviceId](Statement& stmt) { stmt.bind(1, deviceId); });
}

int64_t AlertRepository::maxId() {
    auto stmt = db_->prepare("SELECT MAX(id) FROM alerts");
    if (stmt.step() && !stmt.columnIsNull(0)) {
        return stmt.columnInt64(0);
    }
    return 0;
}

int AlertRepository::deleteResolvedBefore(std::chrono::system_clock::time_point cutoff) {
    auto stmt = db_->prepare("DELETE FROM alerts WHERE resolved_at IS NOT NULL AND resolved_at < ?");
    stmt.bind(1, Database::formatTimestamp(cutoff));
    stmt.step();
    return db_->changes();
}

std::vector<core::Alert> AlertRepository::select(const std::string& where,
                                                 const std::function<void(Statement&)>& bind) {
    std::vector<core::Alert> alerts;
    auto stmt = db_->prepare(R"(
        SELECT id, device_id, interface_index, interface_name, rule, severity, message,
               first_fired, last_seen, resolved_at, acknowledged
        FROM alerts )" + where);
    bind(stmt);

    while (stmt.step()) {
        alerts.push_back(rowToAlert(stmt));
    }
    return alerts;
}

core::Alert AlertRepository::rowToAlert(Statement& stmt) {
    core::Alert alert;
    alert.id = stmt.columnInt64(0);
    alert.deviceId = stmt.columnInt64(1);
    if (!stmt.columnIsNull(2)) {
        alert.interfaceIndex = stmt.columnInt(2);
    }
    alert.interfaceName = stmt.columnText(3);
    alert.rule = static_cast<core::AlertRule>(stmt.columnInt(4));
    alert.severity = static_cast<core::AlertSeverity>(stmt.columnInt(5));
    alert.message = stmt.columnText(6);
    alert.firstFired = Database::parseTimestamp(stmt.columnText(7));
    alert.lastSeen = Database::parseTimestamp(stmt.columnText(8));
    if (!stmt.columnIsNull(9)) {
        alert.resolvedAt = Database::parseTimestamp(stmt.columnText(9));
    }
    alert.acknowledged = stmt.columnInt(10) != 0;
    return alert;
}

} // namespace vlanvision::infra
