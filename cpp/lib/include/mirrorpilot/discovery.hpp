/**************************************************************************
*   Copyright (C) 2010-2014 by Eugene V. Lyubimkin                        *
*                                                                         *
*   This program is free software; you can redistribute it and/or modify  *
*   it under the terms of the GNU General Public License                  *
*   (version 3 or above) as published by the Free Software Foundation.    *
*                                                                         *
*   This program is distributed in the hope that it will be useful,       *
*   but WITHOUT ANY WARRANTY; without even the implied warranty of        *
*   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the         *
*   GNU General Public License for more details.                          *
*                                                                         *
*   You should have received a copy of the GNU GPL                        *
*   along with this program; if not, write to the                         *
*   Free Software Foundation, Inc.,                                       *
*   51 Franklin St, Fifth Floor, Boston, MA 02110-1301, USA               *
**************************************************************************/
#ifndef MIRRORPILOT_DISCOVERY_SEEN
#define MIRRORPILOT_DISCOVERY_SEEN

/// @file

#include <mirrorpilot/distributor.hpp>
#include <mirrorpilot/mirror.hpp>

namespace mirrorpilot {
namespace discovery {

/// geolocates the host through public services
/**
 * @return country name, or empty string if every service failed
 */
MIRRORPILOT_API string detectCountry(const DiscoveryContext&);

/// @name backends
/**
 * Each fetches its provider's mirror list and returns unranked candidates.
 *
 * @exception Exception if the mirror list cannot be fetched or parsed, or
 * contains no mirrors
 */
///@{
MIRRORPILOT_API vector< CandidateMirror > discoverDebian(const DiscoveryContext&);
MIRRORPILOT_API vector< CandidateMirror > discoverUbuntu(const DiscoveryContext&);
MIRRORPILOT_API vector< CandidateMirror > discoverLinuxMint(const DiscoveryContext&);
///@}

/// @name page parsers
///@{
MIRRORPILOT_API vector< CandidateMirror > parseDebianMirrorPage(const string& html, const string& country);
MIRRORPILOT_API vector< CandidateMirror > parseUbuntuMirrorList(const string& text);
MIRRORPILOT_API vector< CandidateMirror > parseLaunchpadMirrorPage(const string& html, const string& country);
MIRRORPILOT_API vector< CandidateMirror > parseLinuxMintMirrorPage(const string& html, const string& country);
/// extracts the country from a geolocation JSON reply
MIRRORPILOT_API string parseCountry(const string& json, const string& key);
///@}

}
}

#endif
