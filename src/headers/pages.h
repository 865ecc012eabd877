#pragma once
/**
 * Handfont — HTML pages
 */

#include "common.h"

string index_html();
string generate_html(const string& message = "");
string download_html(const string& key);
string error_html(int status, const string& message);
