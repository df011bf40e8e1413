#ifndef OPENHSV_MESSAGE__H
#define OPENHSV_MESSAGE__H

#include <iostream>
#include <string>
#include <sstream>

#include <openhsv_exception.h>

void openhsv_set_message_prefix(const std::string& mess);
void openhsv_set_debug(bool yesorno);
void openhsv_set_verbose(bool yesorno);
bool openhsv_is_verbose();
bool openhsv_is_debug();

void openhsv_debug(const std::string& mess);
void openhsv_info(const std::string& mess);
void openhsv_warning(const std::string& mess);
void openhsv_error(const std::string& mess);

#define OPENHSV_DEBUG(mess) {std::stringstream ss; ss << mess; openhsv_debug(ss.str()); }
#define OPENHSV_INFO(mess) {std::stringstream ss; ss << mess; openhsv_info(ss.str()); }
#define OPENHSV_WARNING(mess) {std::stringstream ss; ss << mess; openhsv_warning(ss.str()); }
#define OPENHSV_ERROR(mess) {std::stringstream ss; ss << mess; openhsv_error(ss.str()); OPENHSV_THROW(ss.str().c_str()); }

#endif
