#include "../include-shared/keyloaders.hpp"
#include "../include-shared/util.hpp"

/**
 * Save the serialized message at the file.
 */
void SaveMessage(const std::string &filename, Serializable &message) {
  std::vector<unsigned char> message_serialized;
  message.serialize(message_serialized);

  std::string message_str = chvec2str(message_serialized);
  CryptoPP::StringSource(message_str, true,
                         new CryptoPP::FileSink(filename.c_str()));
}

/**
 * Load a serialized message from the file.
 */
void LoadMessage(const std::string &filename, Serializable &message) {
  std::string message_str;
  CryptoPP::FileSource(filename.c_str(), true,
                       new CryptoPP::StringSink(message_str));
  std::vector<unsigned char> message_serialized = str2chvec(message_str);
  message.deserialize(message_serialized);
}

/**
 * Save an integer at the file.
 */
void SaveInteger(const std::string &filename, const CryptoPP::Integer &i) {
  CryptoPP::StringSource(CryptoPP::IntToString(i), true,
                         new CryptoPP::FileSink(filename.c_str()));
}

/**
 * Load an integer from the file.
 */
void LoadInteger(const std::string &filename, CryptoPP::Integer &i) {
  std::string i_str;
  CryptoPP::FileSource(filename.c_str(), true, new CryptoPP::StringSink(i_str));
  i = string_to_integer(i_str);
}
