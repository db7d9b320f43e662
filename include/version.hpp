#ifndef GITFINDR_VERSION_HPP
#define GITFINDR_VERSION_HPP

#define GITFINDR_VERSION "0.1.0"

#endif // GITFINDR_VERSION_HPP
