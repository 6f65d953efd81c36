#pragma once
#include <iostream>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <utility>
#include <vector>

#include "../../include-shared/messages.hpp"

typedef VoterToCoordinator_Register_Message RegistrationRow;
typedef VoterToCoordinator_Vote_Message BallotRow;
typedef CoordinatorToWorld_Tally_Message TallyRow;

// Public transcript of every accepted submission, in acceptance order.
class DBDriver {
public:
  DBDriver();
  ~DBDriver();
  int open(std::string dbpath);
  int close();

  void init_tables();
  void reset_tables();

  bool insert_registration(RegistrationRow registration);
  std::vector<RegistrationRow> all_registrations();

  bool insert_ballot(BallotRow ballot);
  std::vector<BallotRow> all_ballots();

  bool insert_tally(TallyRow tally);
  std::pair<TallyRow, bool> find_tally();

private:
  bool exec(const std::string &query, const std::string &what);
  bool insert_blobs(const std::string &query,
                    const std::vector<std::string> &values,
                    const std::string &what);
  std::vector<std::string> select_blobs(const std::string &query);

  std::mutex mtx;
  sqlite3 *db;
};
