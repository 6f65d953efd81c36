#include <cstring>

#include "../include-shared/messages.hpp"
#include "../include-shared/util.hpp"

namespace {
/**
 * Throw unless data holds at least `len` bytes starting at idx.
 */
void require_bytes(std::vector<unsigned char> &data, size_t idx, size_t len) {
  if (idx > data.size() || data.size() - idx < len) {
    throw std::runtime_error("Truncated message.");
  }
}

/**
 * Throw unless the first byte of data is the expected message type.
 */
void require_type(std::vector<unsigned char> &data, MessageType::T type) {
  require_bytes(data, 0, 1);
  if (data[0] != type) {
    throw std::runtime_error("Unexpected message type " +
                             std::to_string((int)data[0]) + ", expected " +
                             std::to_string((int)type) + ".");
  }
}
} // namespace

// ================================================
// MESSAGE TYPES
// ================================================

/**
 * Get message type.
 */
MessageType::T get_message_type(std::vector<unsigned char> &data) {
  require_bytes(data, 0, 1);
  return (MessageType::T)data[0];
}

// ================================================
// SERIALIZERS
// ================================================

/**
 * Puts the bool b into the end of data.
 */
int put_bool(bool b, std::vector<unsigned char> &data) {
  data.push_back((char)b);
  return 1;
}

/**
 * Puts the string s into the end of data.
 */
int put_string(std::string s, std::vector<unsigned char> &data) {
  // Put length
  int idx = data.size();
  data.resize(idx + sizeof(size_t));
  size_t str_size = s.size();
  std::memcpy(&data[idx], &str_size, sizeof(size_t));

  // Put string
  data.insert(data.end(), s.begin(), s.end());
  return data.size() - idx;
}

/**
 * Puts the integer i into the end of data.
 */
int put_integer(CryptoPP::Integer i, std::vector<unsigned char> &data) {
  return put_string(CryptoPP::IntToString(i), data);
}

/**
 * Puts a count followed by each integer of v into the end of data.
 */
int put_integers(const std::vector<CryptoPP::Integer> &v,
                 std::vector<unsigned char> &data) {
  int idx = data.size();
  data.resize(idx + sizeof(size_t));
  size_t v_size = v.size();
  std::memcpy(&data[idx], &v_size, sizeof(size_t));
  for (const CryptoPP::Integer &i : v) {
    put_integer(i, data);
  }
  return data.size() - idx;
}

/**
 * Puts the next bool from data at index idx into b.
 */
int get_bool(bool *b, std::vector<unsigned char> &data, int idx) {
  require_bytes(data, idx, 1);
  *b = (bool)data[idx];
  return 1;
}

/**
 * Puts the next string from data at index idx into s.
 */
int get_string(std::string *s, std::vector<unsigned char> &data, int idx) {
  // Get length
  require_bytes(data, idx, sizeof(size_t));
  size_t str_size;
  std::memcpy(&str_size, &data[idx], sizeof(size_t));

  // Get string
  require_bytes(data, idx + sizeof(size_t), str_size);
  std::vector<unsigned char> svec(data.begin() + idx + sizeof(size_t),
                                  data.begin() + idx + sizeof(size_t) +
                                      str_size);
  *s = chvec2str(svec);
  return sizeof(size_t) + str_size;
}

/**
 * Puts the next integer from data at index idx into i.
 */
int get_integer(CryptoPP::Integer *i, std::vector<unsigned char> &data,
                int idx) {
  std::string i_str;
  int n = get_string(&i_str, data, idx);
  *i = string_to_integer(i_str);
  return n;
}

/**
 * Puts the next counted list of integers from data at index idx into v.
 */
int get_integers(std::vector<CryptoPP::Integer> *v,
                 std::vector<unsigned char> &data, int idx) {
  require_bytes(data, idx, sizeof(size_t));
  size_t v_size;
  std::memcpy(&v_size, &data[idx], sizeof(size_t));
  int n = sizeof(size_t);

  v->clear();
  for (size_t j = 0; j < v_size; j++) {
    CryptoPP::Integer i;
    n += get_integer(&i, data, idx + n);
    v->push_back(i);
  }
  return n;
}

// ================================================
// PROOFS
// ================================================

/**
 * serialize PublicKeyZKP_Struct.
 */
void PublicKeyZKP_Struct::serialize(std::vector<unsigned char> &data) {
  // Add message type.
  data.push_back((char)MessageType::PublicKeyZKP_Struct);

  // Add fields.
  put_integer(this->pk, data);
  put_integer(this->gv, data);
  put_integer(this->r, data);
}

/**
 * deserialize PublicKeyZKP_Struct.
 */
int PublicKeyZKP_Struct::deserialize(std::vector<unsigned char> &data) {
  // Check correct message type.
  require_type(data, MessageType::PublicKeyZKP_Struct);

  // Get fields.
  int n = 1;
  n += get_integer(&this->pk, data, n);
  n += get_integer(&this->gv, data, n);
  n += get_integer(&this->r, data, n);
  return n;
}

/**
 * serialize VoteZKP_Struct.
 */
void VoteZKP_Struct::serialize(std::vector<unsigned char> &data) {
  // Add message type.
  data.push_back((char)MessageType::VoteZKP_Struct);

  // Add fields.
  put_integers(this->a, data);
  put_integers(this->b, data);
  put_integers(this->c, data);
  put_integers(this->r, data);
}

/**
 * deserialize VoteZKP_Struct.
 */
int VoteZKP_Struct::deserialize(std::vector<unsigned char> &data) {
  // Check correct message type.
  require_type(data, MessageType::VoteZKP_Struct);

  // Get fields.
  int n = 1;
  n += get_integers(&this->a, data, n);
  n += get_integers(&this->b, data, n);
  n += get_integers(&this->c, data, n);
  n += get_integers(&this->r, data, n);
  return n;
}

// ================================================
// VOTER <==> COORDINATOR
// ================================================

/**
 * serialize VoterToCoordinator_Register_Message.
 */
void VoterToCoordinator_Register_Message::serialize(
    std::vector<unsigned char> &data) {
  // Add message type.
  data.push_back((char)MessageType::VoterToCoordinator_Register_Message);

  // Add fields.
  put_string(this->voter_id, data);

  std::vector<unsigned char> zkp_data;
  this->zkp.serialize(zkp_data);
  data.insert(data.end(), zkp_data.begin(), zkp_data.end());
}

/**
 * deserialize VoterToCoordinator_Register_Message.
 */
int VoterToCoordinator_Register_Message::deserialize(
    std::vector<unsigned char> &data) {
  // Check correct message type.
  require_type(data, MessageType::VoterToCoordinator_Register_Message);

  // Get fields.
  int n = 1;
  n += get_string(&this->voter_id, data, n);

  std::vector<unsigned char> zkp_slice =
      std::vector<unsigned char>(data.begin() + n, data.end());
  n += this->zkp.deserialize(zkp_slice);
  return n;
}

/**
 * serialize VoterToCoordinator_Vote_Message.
 */
void VoterToCoordinator_Vote_Message::serialize(
    std::vector<unsigned char> &data) {
  // Add message type.
  data.push_back((char)MessageType::VoterToCoordinator_Vote_Message);

  // Add fields.
  put_string(this->voter_id, data);
  put_integer(this->vote, data);
  put_bool(this->has_zkp, data);
  if (this->has_zkp) {
    std::vector<unsigned char> zkp_data;
    this->zkp.serialize(zkp_data);
    data.insert(data.end(), zkp_data.begin(), zkp_data.end());
  }
}

/**
 * deserialize VoterToCoordinator_Vote_Message.
 */
int VoterToCoordinator_Vote_Message::deserialize(
    std::vector<unsigned char> &data) {
  // Check correct message type.
  require_type(data, MessageType::VoterToCoordinator_Vote_Message);

  // Get fields.
  int n = 1;
  n += get_string(&this->voter_id, data, n);
  n += get_integer(&this->vote, data, n);
  n += get_bool(&this->has_zkp, data, n);
  if (this->has_zkp) {
    std::vector<unsigned char> zkp_slice =
        std::vector<unsigned char>(data.begin() + n, data.end());
    n += this->zkp.deserialize(zkp_slice);
  }
  return n;
}

// ================================================
// COORDINATOR <==> WORLD
// ================================================

/**
 * serialize CoordinatorToWorld_Tally_Message.
 */
void CoordinatorToWorld_Tally_Message::serialize(
    std::vector<unsigned char> &data) {
  // Add message type.
  data.push_back((char)MessageType::CoordinatorToWorld_Tally_Message);

  // Add fields.
  put_integers(this->counts, data);
}

/**
 * deserialize CoordinatorToWorld_Tally_Message.
 */
int CoordinatorToWorld_Tally_Message::deserialize(
    std::vector<unsigned char> &data) {
  // Check correct message type.
  require_type(data, MessageType::CoordinatorToWorld_Tally_Message);

  // Get fields.
  int n = 1;
  n += get_integers(&this->counts, data, n);
  return n;
}
