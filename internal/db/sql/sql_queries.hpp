#pragma once

namespace retest::db::sql {

/*
  Canonical SQL used by the sqlite backend.

  IMPORTANT:
  Every statement is scoped by environment.
*/

// nodes

static constexpr const char* UPSERT_NODE =
    "INSERT INTO nodes(environment,node_id,outcome,duration_ms)"
    " VALUES(?,?,?,?)"
    " ON CONFLICT(environment,node_id) DO UPDATE SET"
    " outcome=excluded.outcome,"
    " duration_ms=excluded.duration_ms;";

static constexpr const char* SELECT_NODE =
    "SELECT node_id,outcome,duration_ms"
    " FROM nodes WHERE environment=? AND node_id=?;";

static constexpr const char* SELECT_NODES =
    "SELECT node_id,outcome,duration_ms"
    " FROM nodes WHERE environment=? ORDER BY node_id;";

static constexpr const char* SELECT_NODE_IDS =
    "SELECT node_id FROM nodes WHERE environment=?;";

static constexpr const char* DELETE_NODE =
    "DELETE FROM nodes WHERE environment=? AND node_id=?;";

// fingerprints

static constexpr const char* DELETE_FINGERPRINT =
    "DELETE FROM node_fingerprint WHERE environment=? AND node_id=?;";

static constexpr const char* INSERT_FINGERPRINT_ENTRY =
    "INSERT INTO node_fingerprint(environment,node_id,path,checksum)"
    " VALUES(?,?,?,?);";

static constexpr const char* SELECT_FINGERPRINT =
    "SELECT path,checksum FROM node_fingerprint"
    " WHERE environment=? AND node_id=? ORDER BY path;";

static constexpr const char* SELECT_FINGERPRINTS =
    "SELECT node_id,path,checksum FROM node_fingerprint"
    " WHERE environment=? ORDER BY node_id,path;";

// files

static constexpr const char* UPSERT_FILE =
    "INSERT INTO files(environment,path,checksum)"
    " VALUES(?,?,?)"
    " ON CONFLICT(environment,path) DO UPDATE SET"
    " checksum=excluded.checksum;";

static constexpr const char* SELECT_FILES =
    "SELECT path,checksum FROM files WHERE environment=? ORDER BY path;";

static constexpr const char* DELETE_UNREFERENCED_FILES =
    "DELETE FROM files WHERE environment=?1 AND path NOT IN"
    " (SELECT path FROM node_fingerprint WHERE environment=?1);";

// attributes

static constexpr const char* UPSERT_ATTRIBUTE =
    "INSERT INTO attributes(environment,key,value)"
    " VALUES(?,?,?)"
    " ON CONFLICT(environment,key) DO UPDATE SET"
    " value=excluded.value;";

static constexpr const char* SELECT_ATTRIBUTE =
    "SELECT value FROM attributes WHERE environment=? AND key=?;";

}
