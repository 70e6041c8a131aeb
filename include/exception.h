
#ifndef EXCEPTION_H
#define EXCEPTION_H

#include <string>

using namespace std;


// which phase of a run raised the error; main() maps all of them to exit(1)
enum ErrorKind { eGeneral, eConfig, eSpace, eResolution, eDeclined, eCopyEngine };


class FBException : public std::exception {
    string message;
    string data;
    ErrorKind kind;
    
public:
    FBException(string msg, ErrorKind k = eGeneral) : message(msg), kind(k) {}
    FBException(string msg, string d, ErrorKind k) : message(msg), data(d), kind(k) {}

    string detail() const { return message; }
    string getData() const { return data; }
    ErrorKind getKind() const { return kind; }

    const char *what() const noexcept override { return message.c_str(); }
};


#endif

