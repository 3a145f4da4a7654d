#ifndef _Errors_hpp
#define _Errors_hpp

#include <exception>
#include <string>
#include "basic.hpp"

namespace PROJECT {

//
// Base class for the recoverable errors of this library. Programming
// errors (reading a cell the caller already knows to exist, and so on)
// are assertions instead.
//
class Exception : public std::exception {
public:
    Exception(const std::string &msg) : thisMessage(msg) { }
    virtual ~Exception() throw() { }

    virtual const char * what() const throw() {
	return thisMessage.c_str();
    }

    const std::string & getMessage() const { return thisMessage; }

private:
    std::string thisMessage;
};

}

#endif
