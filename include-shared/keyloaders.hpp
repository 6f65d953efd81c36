#pragma once

#include <iostream>
#include <string>

#include <crypto++/cryptlib.h>
#include <crypto++/files.h>
#include <crypto++/filters.h>
#include <crypto++/integer.h>

#include "../include-shared/messages.hpp"

void SaveMessage(const std::string &filename, Serializable &message);
void LoadMessage(const std::string &filename, Serializable &message);

void SaveInteger(const std::string &filename, const CryptoPP::Integer &i);
void LoadInteger(const std::string &filename, CryptoPP::Integer &i);
