#include <iostream>

#include "../../include-shared/util.hpp"
#include "../../include/drivers/db_driver.hpp"

// ================================================
// INITIALIZATION
// ================================================

/**
 * Initialize DBDriver.
 */
DBDriver::DBDriver() { this->db = nullptr; }

DBDriver::~DBDriver() { this->close(); }

/**
 * Open a particular db file.
 */
int DBDriver::open(std::string dbpath) {
  std::unique_lock<std::mutex> lck(this->mtx);
  return sqlite3_open(dbpath.c_str(), &this->db);
}

/**
 * Close db.
 */
int DBDriver::close() {
  std::unique_lock<std::mutex> lck(this->mtx);
  int exit = sqlite3_close(this->db);
  this->db = nullptr;
  return exit;
}

/**
 * Initialize tables.
 */
void DBDriver::init_tables() {
  // Lock db driver.
  std::unique_lock<std::mutex> lck(this->mtx);

  // create registration table
  this->exec("CREATE TABLE IF NOT EXISTS registration("
             "voter_id TEXT PRIMARY KEY NOT NULL, "
             "public_key TEXT UNIQUE NOT NULL, "
             "message BLOB NOT NULL);",
             "creating registration table");

  // create ballot table
  this->exec("CREATE TABLE IF NOT EXISTS ballot("
             "voter_id TEXT PRIMARY KEY NOT NULL, "
             "vote TEXT NOT NULL, "
             "message BLOB NOT NULL);",
             "creating ballot table");

  // create tally table; there is at most one tally per election
  this->exec("CREATE TABLE IF NOT EXISTS tally("
             "id INTEGER PRIMARY KEY CHECK (id = 0), "
             "message BLOB NOT NULL);",
             "creating tally table");
}

/**
 * Reset tables by deleting every row.
 */
void DBDriver::reset_tables() {
  // Lock db driver.
  std::unique_lock<std::mutex> lck(this->mtx);

  std::vector<std::string> table_names;
  table_names.push_back("registration");
  table_names.push_back("ballot");
  table_names.push_back("tally");

  for (std::string table : table_names) {
    this->exec("DELETE FROM " + table + ";", "resetting table " + table);
  }
}

// ================================================
// REGISTRATION
// ================================================

/**
 * Insert the given registration; fails on a repeated voter or public key.
 */
bool DBDriver::insert_registration(RegistrationRow registration) {
  // Lock db driver.
  std::unique_lock<std::mutex> lck(this->mtx);

  std::vector<unsigned char> data;
  registration.serialize(data);

  std::vector<std::string> values;
  values.push_back(registration.voter_id);
  values.push_back(integer_to_string(registration.zkp.pk));
  values.push_back(chvec2str(data));
  return this->insert_blobs("INSERT INTO registration(voter_id, public_key, "
                            "message) VALUES(?, ?, ?);",
                            values, "inserting registration");
}

/**
 * Return all registrations in the order they were accepted.
 */
std::vector<RegistrationRow> DBDriver::all_registrations() {
  // Lock db driver.
  std::unique_lock<std::mutex> lck(this->mtx);

  std::vector<RegistrationRow> res;
  for (std::string blob :
       this->select_blobs("SELECT message FROM registration ORDER BY rowid")) {
    std::vector<unsigned char> data = str2chvec(blob);
    RegistrationRow registration;
    registration.deserialize(data);
    res.push_back(registration);
  }
  return res;
}

// ================================================
// BALLOT
// ================================================

/**
 * Insert the given ballot; fails if the voter already has one.
 */
bool DBDriver::insert_ballot(BallotRow ballot) {
  // Lock db driver.
  std::unique_lock<std::mutex> lck(this->mtx);

  std::vector<unsigned char> data;
  ballot.serialize(data);

  std::vector<std::string> values;
  values.push_back(ballot.voter_id);
  values.push_back(integer_to_string(ballot.vote));
  values.push_back(chvec2str(data));
  return this->insert_blobs(
      "INSERT INTO ballot(voter_id, vote, message) VALUES(?, ?, ?);", values,
      "inserting ballot");
}

/**
 * Return all ballots in the order they were accepted.
 */
std::vector<BallotRow> DBDriver::all_ballots() {
  // Lock db driver.
  std::unique_lock<std::mutex> lck(this->mtx);

  std::vector<BallotRow> res;
  for (std::string blob :
       this->select_blobs("SELECT message FROM ballot ORDER BY rowid")) {
    std::vector<unsigned char> data = str2chvec(blob);
    BallotRow ballot;
    ballot.deserialize(data);
    res.push_back(ballot);
  }
  return res;
}

// ================================================
// TALLY
// ================================================

/**
 * Insert the verified tally; fails if one is already recorded.
 */
bool DBDriver::insert_tally(TallyRow tally) {
  // Lock db driver.
  std::unique_lock<std::mutex> lck(this->mtx);

  std::vector<unsigned char> data;
  tally.serialize(data);

  std::vector<std::string> values;
  values.push_back(chvec2str(data));
  return this->insert_blobs("INSERT INTO tally(id, message) VALUES(0, ?);",
                            values, "inserting tally");
}

/**
 * Find the recorded tally, if any.
 */
std::pair<TallyRow, bool> DBDriver::find_tally() {
  // Lock db driver.
  std::unique_lock<std::mutex> lck(this->mtx);

  TallyRow tally;
  std::vector<std::string> blobs =
      this->select_blobs("SELECT message FROM tally WHERE id = 0");
  if (blobs.empty()) {
    return std::make_pair(tally, false);
  }
  std::vector<unsigned char> data = str2chvec(blobs[0]);
  tally.deserialize(data);
  return std::make_pair(tally, true);
}

// ================================================
// HELPERS (caller holds mtx)
// ================================================

/**
 * Run a statement with no parameters.
 */
bool DBDriver::exec(const std::string &query, const std::string &what) {
  char *err = nullptr;
  int exit = sqlite3_exec(this->db, query.c_str(), NULL, 0, &err);
  if (exit != SQLITE_OK) {
    std::cerr << "Error " << what << ": " << (err ? err : "unknown")
              << std::endl;
    sqlite3_free(err);
    return false;
  }
  return true;
}

/**
 * Run an insert binding each value as a blob.
 */
bool DBDriver::insert_blobs(const std::string &query,
                            const std::vector<std::string> &values,
                            const std::string &what) {
  // Prepare statement.
  sqlite3_stmt *stmt = nullptr;
  int exit = sqlite3_prepare_v2(this->db, query.c_str(), query.length(), &stmt,
                                nullptr);
  if (exit != SQLITE_OK) {
    std::cerr << "Error " << what << ": " << sqlite3_errmsg(this->db)
              << std::endl;
    sqlite3_finalize(stmt);
    return false;
  }
  for (size_t i = 0; i < values.size(); i++) {
    sqlite3_bind_blob(stmt, i + 1, values[i].data(), values[i].length(),
                      SQLITE_TRANSIENT);
  }

  // Run and return.
  int step = sqlite3_step(stmt);
  exit = sqlite3_finalize(stmt);
  if (step != SQLITE_DONE || exit != SQLITE_OK) {
    std::cerr << "Error " << what << ": " << sqlite3_errmsg(this->db)
              << std::endl;
    return false;
  }
  return true;
}

/**
 * Return the first column of every row as raw bytes.
 */
std::vector<std::string> DBDriver::select_blobs(const std::string &query) {
  std::vector<std::string> res;

  // Prepare statement.
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(this->db, query.c_str(), query.length(), &stmt,
                         nullptr) != SQLITE_OK) {
    std::cerr << "Error preparing query: " << sqlite3_errmsg(this->db)
              << std::endl;
    sqlite3_finalize(stmt);
    return res;
  }

  // Retreive rows.
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    const void *raw_result = sqlite3_column_blob(stmt, 0);
    int num_bytes = sqlite3_column_bytes(stmt, 0);
    if (raw_result == nullptr || num_bytes == 0) {
      res.push_back(std::string());
      continue;
    }
    res.push_back(std::string((const char *)raw_result, num_bytes));
  }

  // Finalize and return.
  int exit = sqlite3_finalize(stmt);
  if (exit != SQLITE_OK) {
    std::cerr << "Error reading rows: " << sqlite3_errmsg(this->db)
              << std::endl;
  }
  return res;
}
