#pragma once

#include <stdexcept>
#include <string>


// base of everything a relief operation can fail with. tools catch this at
// the top of main(), log it and exit non-zero; nothing is retried
class relief_error : public std::runtime_error {
public:
	explicit relief_error(const std::string &msg) : std::runtime_error(msg) {}
};

// the selected face doesn't lie on a plane
class non_planar_face : public relief_error {
public:
	explicit non_planar_face(const std::string &msg) : relief_error(msg) {}
};

class unsupported_character : public relief_error {
	char character_;

public:
	explicit unsupported_character(char ch) :
		relief_error(std::string("unsupported character '") + ch + "' in text"),
		character_{ch} {}

	char character() const {
		return character_;
	}
};

// QR encoding or rasterisation gave nothing to build
class empty_matrix : public relief_error {
public:
	explicit empty_matrix(const std::string &msg) : relief_error(msg) {}
};

// the kernel rejected a cut/fuse/common, message carries OCCT's alerts
class boolean_operation_failed : public relief_error {
public:
	explicit boolean_operation_failed(const std::string &msg) : relief_error(msg) {}
};

class missing_dependency : public relief_error {
public:
	explicit missing_dependency(const std::string &msg) : relief_error(msg) {}
};

// malformed records or command line values
class invalid_parameter : public relief_error {
public:
	explicit invalid_parameter(const std::string &msg) : relief_error(msg) {}
};
